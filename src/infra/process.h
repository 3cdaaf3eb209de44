#if !defined(_FANMV_INFRA_PROCESS_H_INCLUDED_)
#define _FANMV_INFRA_PROCESS_H_INCLUDED_

#if !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FANMV_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    struct process_result
    {
        // Exit code of the child, or 128 + signal number if it was killed
        int exit_status = -1;

        std::string stdout_text { };
        std::string stderr_text { };
        std::chrono::steady_clock::duration elapsed { };
    };

    //
    // Spawn argv[0] (searched in PATH), capture stdout and stderr, and wait
    // for it to exit. Throws std::system_error if the child can't be started.
    //
    process_result run_process(const std::vector<std::string>& argv);

    std::string join_command_line(const std::vector<std::string>& argv);

}  // namespace infra


#endif  // !defined(_FANMV_INFRA_PROCESS_H_INCLUDED_)
