#ifndef TILEHARVEST_CLI_H
#define TILEHARVEST_CLI_H

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cli {
    struct Args {
        std::string name;
        std::string render_type;
        std::vector<double> bbox;
        std::vector<int> zoom;
        std::filesystem::path output_root;
        std::string url_template;
        std::optional<std::string> cache_template;
        std::string scheme;
        unsigned max_attempts;
        unsigned retry_max_attempts;
        double timeout;
        double backoff_base;
        double backoff_jitter;
        unsigned workers;
        unsigned max_rounds;
        double round_timeout;
        size_t missing_sample;
        spdlog::level::level_enum log_level;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> report_json;
        bool check_only;
        bool estimate;
        bool progress;
    };

    Args parse(int argc, const char *const *argv);
}

#endif
