//
// Created by Giuseppe Francione on 10/10/26.
//

#ifndef SUBSMITH_PROCESS_RUNNER_HPP
#define SUBSMITH_PROCESS_RUNNER_HPP

#include <string>
#include <vector>

namespace subsmith {

    /**
     * @brief Exit status and trailing output of a child process.
     */
    struct ProcessOutcome {
        int exit_code = -1;       ///< Exit status, or 128 + signal number if killed
        std::string output_tail;  ///< Last lines written to stdout/stderr
    };

    /**
     * @brief Runs an external program and waits for it.
     *
     * The program is looked up on PATH. Its stdout and stderr are merged,
     * logged line by line at Debug level under @p tag, and the last few
     * lines are kept for error reporting.
     *
     * @param args argv of the child; args[0] is the program.
     * @throws std::runtime_error if the process cannot be spawned
     *         (exit code 127 from the child is reported as a spawn failure too).
     */
    ProcessOutcome run_process(const std::vector<std::string>& args, const std::string& tag);

} // namespace subsmith

#endif // SUBSMITH_PROCESS_RUNNER_HPP
