// hearth controller
// Discovers devices, sends policy-gated requests and listens to device events

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "control/controller.hpp"
#include "device/json.hpp"
#include "discovery/avahi_browser.hpp"
#include "logging/logger.hpp"
#include "mqtt/mqtt_client.hpp"
#include "response/response.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "transport/http_transport.hpp"

namespace {

constexpr const char *kDefaultConfigPath = "hearth-controller.yaml";

enum class Command { LIST, SEND, EVENTS };

void print_usage() {
    std::cerr << "Usage: hearth-controller [OPTIONS] [COMMAND]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: " << kDefaultConfigPath << " if present)\n";
    std::cerr << "  --help, -h       Show this help\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  --list                                Discover devices and print them as JSON (default)\n";
    std::cerr << "  --send DEVICE_ID ROUTE [name=value]   Send one request and print the outcome\n";
    std::cerr << "  --events                              Print device events until SIGINT/SIGTERM\n";
    std::cerr << "                                        (default when events.enabled is set)\n";
}

// Prints the decoded body of a response to stdout
struct ResponsePrinter {
    bool operator()(const hearth::response::SkippedResponse &) const {
        std::cout << "Skipped (blocked by policy)" << std::endl;
        return true;
    }

    bool operator()(const hearth::response::OkResponse &response) const {
        hearth::Error error;
        if (!response.parse_body(error)) {
            return false;
        }
        std::cout << "Ok" << std::endl;
        return true;
    }

    bool operator()(const hearth::response::SerialResponse &response) const {
        nlohmann::json body;
        hearth::Error error;
        if (!response.parse_body_json(body, error)) {
            return false;
        }
        std::cout << body.dump(2) << std::endl;
        return true;
    }

    bool operator()(const hearth::response::InfoResponse &response) const {
        hearth::response::DeviceInfo info;
        hearth::Error error;
        if (!response.parse_body(info, error)) {
            return false;
        }
        nlohmann::json body = info;
        std::cout << body.dump(2) << std::endl;
        return true;
    }

    bool operator()(hearth::response::StreamResponse &response) const {
        hearth::Error error;
        const bool ok = response.for_each_chunk(
            4096,
            [](const char *data, size_t size) {
                std::cout.write(data, static_cast<std::streamsize>(size));
                return static_cast<bool>(std::cout);
            },
            error);
        std::cout.flush();
        return ok;
    }
};

bool parse_device_id(const std::string &text, size_t &out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(text));
    } catch (const std::exception &) {
        return false;
    }
    return true;
}

// "name=value" pairs typed after the route's schema; unknown names are kept
// as strings so the request validation reports them
bool parse_arguments(const std::vector<std::string> &args, const hearth::ParametersSchema &schema,
                     hearth::ParametersValues &out) {
    for (const auto &arg : args) {
        const size_t eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_ERROR("Invalid parameter '" << arg << "', expected name=value");
            return false;
        }
        const std::string name = arg.substr(0, eq);
        const std::string text = arg.substr(eq + 1);

        const hearth::ParameterEntry *entry = hearth::find_parameter(schema, name);
        if (entry == nullptr) {
            out[name] = text;
            continue;
        }

        hearth::ParameterValue value;
        std::string error;
        if (!hearth::parse_parameter_value(entry->kind, text, value, error)) {
            LOG_ERROR("Invalid value for '" << name << "': " << error);
            return false;
        }
        out[name] = value;
    }
    return true;
}

int run_send(hearth::control::Controller &controller, size_t device_id, const std::string &route,
             const std::vector<std::string> &args) {
    hearth::Error error;
    auto device = controller.device(device_id, error);
    if (!device) {
        return 1;
    }

    std::optional<hearth::control::RequestSender> sender;
    if (!device->request(route, sender, error)) {
        return 1;
    }

    hearth::response::Response response;
    if (args.empty()) {
        if (!sender->send(response, error)) {
            return 1;
        }
    } else {
        hearth::ParametersValues values;
        if (!parse_arguments(args, sender->request().parameters(), values)) {
            return 1;
        }
        if (!sender->send_with_parameters(values, response, error)) {
            return 1;
        }
    }

    return std::visit(ResponsePrinter{}, response) ? 0 : 1;
}

int run_events(hearth::control::Controller &controller, size_t buffer_size) {
    std::string signal_error;
    if (!hearth::runtime::SignalHandler::install(signal_error)) {
        LOG_ERROR(signal_error);
        return 1;
    }

    hearth::Error error;
    auto receiver = controller.start_event_receivers(buffer_size, error);
    if (!receiver) {
        return 1;
    }

    LOG_INFO("Listening for events, press Ctrl+C to stop");
    while (!hearth::runtime::SignalHandler::is_shutdown_requested()) {
        auto payload = receiver->recv(200);
        if (payload) {
            std::cout << hearth::device::encode_event_payload(*payload).dump() << std::endl;
        }
    }

    LOG_INFO(hearth::runtime::SignalHandler::signal_name(hearth::runtime::SignalHandler::last_signal())
             << " received, stopping event receivers...");
    receiver.reset();
    controller.shutdown();
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path;
    Command command = Command::LIST;
    bool command_given = false;
    size_t device_id = 0;
    std::string route;
    std::vector<std::string> send_args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--list") {
            command = Command::LIST;
            command_given = true;
        } else if (arg == "--events") {
            command = Command::EVENTS;
            command_given = true;
        } else if (arg == "--send") {
            if (i + 2 >= argc || !parse_device_id(argv[i + 1], device_id)) {
                std::cerr << "--send expects DEVICE_ID ROUTE [name=value...]\n";
                return 1;
            }
            route = argv[i + 2];
            i += 2;
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                send_args.push_back(argv[++i]);
            }
            command = Command::SEND;
            command_given = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    hearth::runtime::ControllerConfig config;
    std::string error;

    if (config_path.empty() && std::filesystem::exists(kDefaultConfigPath)) {
        config_path = kDefaultConfigPath;
    }

    if (!config_path.empty()) {
        if (!std::filesystem::exists(config_path)) {
            // Using cerr here as logger might not be initialized/configured
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }
        LOG_INFO("Loading config: " << config_path);
        if (!hearth::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    hearth::logging::Logger::set_level(hearth::logging::string_to_level(config.logging.level));

    // Without an explicit command, an events-enabled config listens for events
    if (!command_given && config.events.enabled) {
        command = Command::EVENTS;
    }

    hearth::policy::Policy policy = hearth::policy::Policy::init();
    if (!hearth::runtime::build_policy(config.policy, policy, error)) {
        LOG_ERROR("Invalid policy: " << error);
        return 1;
    }

    hearth::control::Controller controller(
        hearth::runtime::build_discovery(config.discovery),
        std::make_shared<hearth::transport::HttpTransport>(hearth::runtime::build_http_config(config.http)),
        []() -> std::unique_ptr<hearth::discovery::IServiceBrowser> {
            return std::make_unique<hearth::discovery::AvahiBrowser>();
        },
        []() -> std::unique_ptr<hearth::mqtt::IBrokerClient> {
            return std::make_unique<hearth::mqtt::MqttClient>();
        });
    controller.policy(std::move(policy));
    controller.set_event_task_config(hearth::runtime::build_event_task_config(config.events));

    LOG_INFO("Discovering " << controller.discovery().service_type() << " ...");
    hearth::Error discovery_error;
    if (!controller.discover(discovery_error)) {
        return 1;
    }

    switch (command) {
        case Command::SEND:
            return run_send(controller, device_id, route, send_args);
        case Command::EVENTS:
            return run_events(controller, config.events.buffer_size);
        case Command::LIST:
        default:
            std::cout << hearth::device::encode_devices(controller.devices()).dump(2) << std::endl;
            return 0;
    }
}
