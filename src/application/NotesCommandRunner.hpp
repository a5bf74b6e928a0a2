/**
 * @file NotesCommandRunner.hpp
 * @brief Dispatches notestamp CLI commands over a stored notes string.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>
#include "application/NotesEditService.hpp"

namespace notestamp::application {

/**
 * @class NotesCommandRunner
 * @brief Runs one CLI command: reads the stored string, writes the result.
 *
 * Settings come from settings.json in the given config directory. Results go
 * to @p out; usage errors and rejected input are reported on std::cerr.
 */
class NotesCommandRunner {
public:
    explicit NotesCommandRunner(std::string configDir, NotesEditService::Clock clock = Timestamp::Now);

    /**
     * @param args Command and its arguments, without the program name or --config.
     *             Empty runs the configured default command.
     * @return Process exit code: 0 on success, 1 for usage errors, bad indices
     *         and malformed retime input.
     */
    int run(std::vector<std::string> args, std::istream& in, std::ostream& out) const;

    static void PrintUsage(std::ostream& out);

private:
    std::string m_configDir;
    NotesEditService::Clock m_clock;

    int runConfig(const std::vector<std::string>& args, std::ostream& out) const;
};

} // namespace notestamp::application
