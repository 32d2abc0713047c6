#include "core/json_codec.hpp"
#include "features/setup_controller.hpp"

#include <curl/curl.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

namespace {
void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command>\n"
              << "\n"
              << "Commands:\n"
              << "  status                       Report whether initial setup is required\n"
              << "  detect                       Inspect the data volume\n"
              << "  test-connection <url>|-      Probe a TeddyCloud server (- reads {\"url\": ...} from stdin)\n"
              << "  save [<file>|-]              Write config from a JSON setup document (default: stdin)\n";
}

bool read_input(const std::string& source, std::string& contents) {
    if (source == "-") {
        contents.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream inFile(source);
    if (!inFile.is_open()) {
        std::cerr << "Could not open input file: " << source << '\n';
        return false;
    }
    std::stringstream ss;
    ss << inFile.rdbuf();
    contents = ss.str();
    return true;
}

int run_save(const SetupController& controller, const std::string& source) {
    std::string contents;
    if (!read_input(source, contents)) {
        return 1;
    }

    SetupInput input;
    std::string error;
    if (!json_codec::parse_setup_input(contents, input, error)) {
        SaveResult rejected;
        rejected.error = "Invalid setup document: " + error;
        std::cout << json_codec::to_json(rejected) << std::endl;
        return 1;
    }

    SaveResult result = controller.save(input);
    std::cout << json_codec::to_json(result) << std::endl;
    return result.success ? 0 : 1;
}

int run_test_connection(const SetupController& controller, const std::string& target) {
    std::string url = target;
    if (target == "-") {
        std::string contents;
        std::string error;
        if (!read_input(target, contents) || !json_codec::parse_probe_request(contents, url, error)) {
            ProbeResult rejected;
            rejected.error = "Invalid connection request: " + error;
            std::cout << json_codec::to_json(rejected) << std::endl;
            return 0;
        }
    }

    std::cout << json_codec::to_json(controller.test_connection(url)) << std::endl;
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    SetupController controller;
    int exit_code = 0;

    if (command == "status") {
        std::cout << json_codec::to_json(controller.status()) << std::endl;
    } else if (command == "detect") {
        std::cout << json_codec::to_json(controller.detect()) << std::endl;
    } else if (command == "test-connection" && argc == 3) {
        exit_code = run_test_connection(controller, argv[2]);
    } else if (command == "save" && argc <= 3) {
        exit_code = run_save(controller, argc == 3 ? argv[2] : "-");
    } else {
        print_usage(argv[0]);
        exit_code = 2;
    }

    curl_global_cleanup();
    return exit_code;
}
