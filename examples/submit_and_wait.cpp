/**
 * @file submit_and_wait.cpp
 * @brief Submit a job payload and wait for its result
 *
 * This example demonstrates:
 * - Loading client configuration from the environment
 * - Submitting a JSON or binary payload file
 * - Following the job state while it is monitored
 * - Printing the result or the failure category
 *
 * Environment: JOBWIRE_API_URL, JOBWIRE_STREAM_URL, JOBWIRE_TOKEN
 */

#include <jobwire/jobwire.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace jobwire;

namespace {

std::atomic<bool> interrupted{false};

void signal_handler(int /*signal*/) {
    interrupted = true;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <payload_file> <backend> [timeout_seconds]\n"
              << "\n"
              << "Environment:\n"
              << "  JOBWIRE_API_URL     Control API base URL (required)\n"
              << "  JOBWIRE_STREAM_URL  Status stream base URL (optional)\n"
              << "  JOBWIRE_TOKEN       Access token\n"
              << std::endl;
}

auto read_file(const std::string& path) -> std::vector<uint8_t> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string payload_path = argv[1];
    std::string backend = argv[2];
    std::chrono::seconds timeout{300};
    if (argc >= 4) {
        timeout = std::chrono::seconds{std::stoi(argv[3])};
    }

    auto payload = read_file(payload_path);
    if (payload.empty()) {
        std::cerr << "Cannot read payload: " << payload_path << std::endl;
        return 1;
    }

    std::signal(SIGINT, signal_handler);

    auto client_result = job_client::builder()
        .with_config(client_config::from_environment())
        .build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().to_string() << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    client.on_state_changed([](const std::string& job_id, orchestrator_state state) {
        std::cout << "[State] " << (job_id.empty() ? "-" : job_id)
                  << " " << to_string(state) << std::endl;
    });

    wait_options options;
    options.on_status = [](const status_event& event) {
        std::cout << "[Status] " << to_string(event.status) << std::endl;
    };

    std::cout << "=== Submit and Wait ===" << std::endl;
    std::cout << "API: " << client.config().api_url << std::endl;
    std::cout << "Backend: " << backend << std::endl;
    std::cout << "Payload: " << payload.size() << " bytes" << std::endl;
    std::cout << std::endl;

    auto pending = client.submit_and_wait_async(payload, backend, timeout, options);
    while (pending.wait_for(std::chrono::milliseconds{100}) != std::future_status::ready) {
        if (interrupted) {
            std::cout << "Interrupted, stopping the wait..." << std::endl;
            options.cancel.cancel();
            interrupted = false;
        }
    }

    auto outcome = pending.get();
    if (!outcome.has_value()) {
        std::cerr << "Job failed: " << outcome.error().to_string() << std::endl;
        return outcome.error().category() == error_category::timeout ? 2 : 1;
    }

    const auto& value = outcome.value();
    std::cout << std::endl;
    std::cout << "Job: " << value.handle.id() << " (" << to_string(value.handle.mode()) << ")"
              << std::endl;
    std::cout << "Final status: " << to_string(value.final_status) << std::endl;
    std::cout << "Monitored by: " << to_string(value.monitored_by) << std::endl;
    if (value.fallback_reason) {
        std::cout << "Fallback reason: " << value.fallback_reason->to_string() << std::endl;
    }

    if (value.result) {
        std::cout << std::endl;
        std::cout << std::string(value.result->begin(), value.result->end()) << std::endl;
    }

    return value.final_status == job_status::completed ? 0 : 1;
}
