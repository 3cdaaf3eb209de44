#if !defined(_FANMV_PROGRAM_OPTIONS_H_INCLUDED_)
#define _FANMV_PROGRAM_OPTIONS_H_INCLUDED_

#if !defined(_FANMV_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FANMV_COMMON_H_INCLUDED_)


namespace fanmv
{
    //
    // A transfer destination: either a local path, or "[user@]host:path" on a
    // remote host (the same syntax rsync accepts).
    //
    struct host_path
    {
    public:
        bool parse(const std::string& value);

        bool is_remote() const noexcept { return host.has_value(); }

        // Back to the "[user@]host:path" form
        [[nodiscard]]
        std::string to_string() const;

        friend std::istream& operator >>(std::istream& iss, host_path& hp)
        {
            std::string value;
            iss >> value;
            hp = host_path();
            if (!hp.parse(value)) {
                throw CLI::ConversionError(value, "host_path");
            }
            return iss;
        }

    public:
        std::optional<std::string> user { };
        std::optional<std::string> host { };
        std::string path { };
    };

    struct program_options_defaults
    {
        static constexpr const double SHORT_BACKOFF_SECONDS = 10;
        static constexpr const double LONG_BACKOFF_SECONDS = 300;
        static constexpr const double MAX_BACKOFF_SECONDS = 86400;
        static constexpr const uint32_t ESCALATE_AFTER_RETRIES = 5;

        static constexpr const char RSYNC_EXECUTABLE[] = "rsync";
    };

    struct base_program_options
    {
    public:
        int arg_verbosity = 0;

    public:
        virtual ~base_program_options() = default;
        virtual void add_options(CLI::App& app);
        virtual bool post_process();
    };


    struct fanmv_program_options : base_program_options
    {
    public:
        std::vector<std::string> arg_sources { };
        std::vector<host_path> arg_destinations { };
        bool arg_shuffle = false;
        std::optional<std::string> arg_bwlimit { };
        std::optional<std::string> arg_ionice_class { };
        bool arg_global_lock = false;
        bool arg_per_source_lock = false;
        double arg_short_backoff_seconds = program_options_defaults::SHORT_BACKOFF_SECONDS;
        double arg_long_backoff_seconds = program_options_defaults::LONG_BACKOFF_SECONDS;
        uint32_t arg_escalate_after = program_options_defaults::ESCALATE_AFTER_RETRIES;
        std::optional<std::string> arg_probe_file { };
        std::string arg_rsync = program_options_defaults::RSYNC_EXECUTABLE;

        // Filled by post_process()
        std::vector<stdfs::path> sources { };
        std::chrono::milliseconds short_backoff { };
        std::chrono::milliseconds long_backoff { };

    public:
        void add_options(CLI::App& app) override;
        bool post_process() override;
    };

}  // namespace fanmv


#endif  // !defined(_FANMV_PROGRAM_OPTIONS_H_INCLUDED_)
