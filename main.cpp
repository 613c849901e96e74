#include <curl/curl.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "inc/config.hpp"
#include "inc/defines.hpp"
#include "inc/httpProbe.hpp"
#include "inc/statusReporter.hpp"
#include "inc/urlSource.hpp"
#include "inc/workQueue.hpp"
#include "inc/workerPool.hpp"

// run with ./sitestatus -i urls.txt
// or with ./sitestatus --input urls.txt -vb 2 to log the worker pool
int main(int argc, const char* argv[]) {
    std::string usage_prompt = checker_usage(argv[0]);

    CheckerConfig config;
    try {
        config = parse_checker_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR, " << e.what() << "\r\n" << usage_prompt;
        return -1;
    }
    if (config.show_help) {
        std::cerr << usage_prompt;
        return -1;
    }

    std::vector<std::string> urls;
    try {
        urls = load_urls(config.input_file);
    } catch (const UrlSourceError& e) {
        std::cerr << "ERROR: " << e.what() << "\r\n";
        return -1;
    }

    CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
    if (res != CURLE_OK) {
        std::cerr << "ERROR: CURL global init\r\n";
        return -1;
    }

    auto start_time = std::chrono::steady_clock::now();

    WorkQueue url_queue;
    fill_queue(url_queue, urls);

    CurlProbe probe;
    StatusReporter reporter(std::cout, std::cerr);
    WorkerPool pool(probe, reporter);
    if (config.verbose > 1) {
        pool.set_verbose(true);
    }

    try {
        pool.run(url_queue);
    } catch (const std::system_error& e) {
        std::cerr << ANSI_RED << "ERROR: cannot start workers: " << e.what() << "\r\n" << ANSI_RESET;
        curl_global_cleanup();
        return -1;
    }

    if (config.verbose > 1) {
        std::chrono::duration<double> total_duration = std::chrono::steady_clock::now() - start_time;
        reporter.log("Total time taken: " + std::to_string(total_duration.count()) + " seconds, " +
                         std::to_string(urls.size()) + " urls",
                     ANSI_BLUE);
    }

    curl_global_cleanup();
    return 0;
}
