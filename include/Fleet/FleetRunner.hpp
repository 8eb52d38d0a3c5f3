#pragma once
#include <functional>
#include <iosfwd>
#include <memory>
#include <vector>
#include "Core/concurrency/EventDispatcher.hpp"
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/interfaces/IGuestLauncher.hpp"
#include "Discovery/DiscoveryTypes.hpp"
#include "Fleet/FleetPlanner.hpp"
#include "Reporting/InstancesTable.hpp"
#include "Virtualization/seed/CloudInitSeed.hpp"
#include "Virtualization/seed/SeedImageBuilder.hpp"
#include "Virtualization/storage/OverlayDisk.hpp"

namespace FLEET {

/**
 * @brief Provisions and starts every guest of a plan
 *
 * Per guest: overlay disk, NVRAM copy, cloud-init seed directory and ISO,
 * then the launch. Dry runs print the equivalent actions instead. With
 * discovery enabled, all guests are looked for concurrently once the last
 * one is up.
 */
class FleetRunner {
public:
    using Discoverer = std::function<DISCOVERY::DiscoveryResult(const DISCOVERY::DiscoveryTarget&)>;

    // dispatcher may be null when discovery is off.
    FleetRunner(FleetPlanner planner,
                std::shared_ptr<ICommandRunner> runner,
                std::shared_ptr<IGuestLauncher> launcher,
                std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher,
                std::ostream& out);

    // Replaces the system-backed AddressDiscovery used for --discover.
    void setDiscoverer(Discoverer discoverer);

    /**
     * @brief Runs the whole plan and writes instances.csv
     * @throws SetupException when a required input file is missing; storage,
     *         seed and launch failures propagate as their own exceptions
     */
    std::vector<REPORTING::InstanceRow> run(const FleetPlan& plan);

private:
    void checkInputs(const FleetPlan& plan) const;
    REPORTING::InstanceRow provision(const FleetPlan& plan, const PlannedGuest& guest);
    REPORTING::InstanceRow describe(const FleetPlan& plan, const PlannedGuest& guest);
    void discoverAll(const FleetPlan& plan, std::vector<REPORTING::InstanceRow>& rows);

    FleetPlanner planner;
    std::shared_ptr<ICommandRunner> runner;
    std::shared_ptr<IGuestLauncher> launcher;
    std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher;
    OverlayDisk disks;
    SeedImageBuilder isoBuilder;
    Discoverer discoverer;
    std::ostream& out;
};

// Discovery budget and pacing applied to every guest of the fleet.
[[nodiscard]] DISCOVERY::DiscoveryConfig discoveryConfigFor(const FleetOptions& options);

// Seed contents for one planned guest.
[[nodiscard]] SeedNetwork seedNetworkFor(const FleetPlan& plan, const PlannedGuest& guest,
                                         const FleetOptions& options);

} // namespace FLEET
