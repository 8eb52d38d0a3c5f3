#include "System/CommandRunner.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <future>
#include <system_error>
#include "System/Logger.hpp"

namespace bp = boost::process;

namespace {

boost::filesystem::path resolveProgram(const std::string& program) {
    boost::filesystem::path p(program);
    if (p.has_parent_path()) {
        boost::system::error_code ec;
        return boost::filesystem::exists(p, ec) ? p : boost::filesystem::path{};
    }
    return bp::search_path(program);
}

} // namespace

CommandRunner::CommandRunner(std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher))
{
    if (!dispatcher_) {
        dispatcher_ = std::make_shared<CONCURRENCY::EventDispatcher>(1);
    }
}

CommandRunner::~CommandRunner() = default;

Result<CommandOutput> CommandRunner::run(const std::string& program,
                                         const std::vector<std::string>& args,
                                         const std::map<std::string, std::string>& env) {
    auto exe = resolveProgram(program);
    if (exe.empty()) return Err(program + ": command not found");

    bp::environment procEnv = boost::this_process::environment();
    for (const auto& [key, value] : env) {
        procEnv[key] = value;
    }

    LSLOG_DEBUG("run: {}", formatCommandLine(program, args));

    boost::asio::io_context ios;
    std::future<std::string> outData;
    std::future<std::string> errData;
    std::error_code ec;
    bp::child child(exe, bp::args(args),
                    bp::std_in.close(),
                    bp::std_out > outData,
                    bp::std_err > errData,
                    procEnv, ios, ec);
    if (ec) return Err(program + ": " + ec.message());

    // Returns once both pipes hit EOF and the exit status has been collected.
    ios.run();
    child.wait(ec);

    CommandOutput output;
    output.exitCode = child.exit_code();
    try {
        output.out = outData.get();
        output.err = errData.get();
    } catch (const std::exception& e) {
        return Err(program + ": reading output failed: " + e.what());
    }
    LSLOG_TRACE("{} exited with {}", program, output.exitCode);
    return output;
}

Result<int> CommandRunner::runAttached(const std::string& program,
                                       const std::vector<std::string>& args) {
    auto exe = resolveProgram(program);
    if (exe.empty()) return Err(program + ": command not found");

    LSLOG_DEBUG("run (attached): {}", formatCommandLine(program, args));
    std::error_code ec;
    const int code = bp::system(exe, bp::args(args), ec);
    if (ec) return Err(program + ": " + ec.message());
    return code;
}

bool CommandRunner::spawnDetached(const std::string& program,
                                  const std::vector<std::string>& args) {
    auto exe = resolveProgram(program);
    if (exe.empty()) return false;

    std::error_code ec;
    bp::child child(exe, bp::args(args),
                    bp::std_in.close(),
                    bp::std_out > bp::null,
                    bp::std_err > bp::null,
                    dispatcher_->context(),
                    bp::on_exit([](int, const std::error_code&) {}),
                    ec);
    if (ec) {
        LSLOG_DEBUG("spawn {} failed: {}", program, ec.message());
        return false;
    }
    child.detach();
    return true;
}

bool CommandRunner::exists(const std::string& program) const {
    return !resolveProgram(program).empty();
}

std::string formatCommandLine(const std::string& program,
                              const std::vector<std::string>& args) {
    std::string line = program;
    for (const auto& a : args) {
        line += ' ';
        if (a.find_first_of(" \t'\"") != std::string::npos) {
            line += '\'' + a + '\'';
        } else {
            line += a;
        }
    }
    return line;
}
