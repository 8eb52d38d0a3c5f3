#pragma once
#include <stdexcept>
#include <string>

class LabSpawnException : public std::runtime_error {
public:
    explicit LabSpawnException(const std::string& msg) : std::runtime_error(msg) {}
};

// Required files missing, bad flags, no usable tool on the host.
class SetupException : public LabSpawnException {
public:
    explicit SetupException(const std::string& msg) : LabSpawnException("[Setup] " + msg) {}
};

class StorageException : public LabSpawnException {
public:
    explicit StorageException(const std::string& msg) : LabSpawnException("[Storage] " + msg) {}
};

class SeedImageException : public LabSpawnException {
public:
    explicit SeedImageException(const std::string& msg) : LabSpawnException("[Seed] " + msg) {}
};

class LaunchException : public LabSpawnException {
public:
    explicit LaunchException(const std::string& msg) : LabSpawnException("[Launch] " + msg) {}
};

class LibvirtException : public LaunchException {
public:
    explicit LibvirtException(const std::string& msg) : LaunchException("[Libvirt] " + msg) {}
};
