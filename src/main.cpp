#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "http.hpp"
#include "report.hpp"
#include <iostream>

int main(int argc, char* argv[]) try {
    dgadmin::CliOptions opts;
    try {
        opts = dgadmin::parse_args(argc, argv);
    } catch (const dgadmin::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << dgadmin::usage_text();
        return dgadmin::kExitUsage;
    }

    if (opts.show_help) {
        std::cout << dgadmin::usage_text();
        return dgadmin::kExitSuccess;
    }
    if (opts.show_version) {
        std::cout << "dgraph-admin " << DGADMIN_VERSION << "\n";
        return dgadmin::kExitSuccess;
    }

    dgadmin::Config config = dgadmin::Config::load();

    dgadmin::http_init();
    dgadmin::PlatformHttpClient http_client;
    int rc = dgadmin::run(opts, config, http_client, std::cin, std::cout, std::cerr);
    dgadmin::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
