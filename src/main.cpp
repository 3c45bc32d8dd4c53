#include "archive.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "exception.hpp"
#include "foreign_install.hpp"
#include "install_plan.hpp"
#include "localization.hpp"
#include "orchestrator.hpp"
#include "prompt.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>
#include <curl/curl.h>

#include <iostream>
#include <string>

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }
    ~CurlGlobalInitializer() {
        curl_global_cleanup();
    }
};

int main(int argc, char* argv[]) {
    CurlGlobalInitializer curl_initializer;
    try {
        init_localization();
        install_exit_handlers();

        cxxopts::Options options(argv[0], get_string("info.description"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("m,mode", get_string("help.mode"), cxxopts::value<std::string>())
            ("r,release", get_string("help.release"), cxxopts::value<std::string>())
            ("mirror", get_string("help.mirror"), cxxopts::value<std::string>())
            ("lock-file", get_string("help.lock_file"), cxxopts::value<std::string>());

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cerr << options.help() << std::endl;
            return 0;
        }

        InstallRequest request;
        if (result.count("mode")) {
            const std::string value = result["mode"].as<std::string>();
            request.mode = parse_mode(value);
            if (!request.mode) {
                log_error(string_format("error.invalid_mode", value));
                return 1;
            }
        }
        if (result.count("release")) {
            request.version = result["release"].as<std::string>();
        }
        if (result.count("mirror")) {
            set_mirror_url(result["mirror"].as<std::string>());
        }
        if (result.count("lock-file")) {
            set_lock_path(result["lock-file"].as<std::string>());
        }

        check_transport_support();

        CurlDownloader downloader;
        LibarchiveExtractor extractor;
        SystemPrivilegeProbe privilege_probe;
        ConsolePromptSource prompts(std::cin, std::cerr);
        HomebrewCaskDetector homebrew;

        InstallationOrchestrator orchestrator(downloader, extractor, privilege_probe);
        orchestrator.set_prompt_source(&prompts);
        orchestrator.set_foreign_detector(&homebrew);
        orchestrator.run(request);

        log_info(get_string("info.restart_shell"));
    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", std::string(e.what())));
        return 1;
    } catch (const GosetupException& e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", std::string(e.what())));
        return 1;
    }

    return 0;
}
