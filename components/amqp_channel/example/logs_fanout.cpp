#include "amqp_channel/channel.hpp"
#include "amqp_channel/config.hpp"
#include "amqp_channel/connection.hpp"
#include "amqp_channel/consumer.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
using namespace amqp_channel;

// Global signal handler
std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    g_running = false;
}

namespace {

int emit(Channel& channel, const std::string& exchange, const std::vector<std::string>& messages) {
    for (const auto& text : messages) {
        Properties properties{{PropertyNames::CONTENT_TYPE, "text/plain"}};
        auto result = channel.publish(exchange, "", text, properties);
        if (!result) {
            std::cerr << "Publish failed: " << errorTypeToString(result.error)
                      << " - " << result.message << std::endl;
            return 1;
        }
        std::cout << " [x] Sent '" << text << "'" << std::endl;
    }
    return 0;
}

int receive(const std::shared_ptr<Channel>& channel, const std::string& exchange) {
    auto queue = channel->declareQueue();
    if (!queue) {
        std::cerr << "Queue declaration failed: " << queue.message << std::endl;
        return 1;
    }

    auto bound = channel->bindQueue(queue.value, exchange, "");
    if (!bound) {
        std::cerr << "Binding failed: " << bound.message << std::endl;
        return 1;
    }

    ConsumerConfig config;
    config.queueName = queue.value;
    config.autoAck = true;

    Consumer consumer(channel, config);
    auto started = consumer.start([](Delivery& delivery) {
        auto text = delivery.message().asText();
        if (text) {
            std::cout << " [x] " << text.value << std::endl;
        } else {
            std::cout << " [x] <" << delivery.message().size() << " bytes of binary data>" << std::endl;
        }
    });
    if (!started) {
        std::cerr << "Consume failed: " << started.message << std::endl;
        return 1;
    }

    std::cout << " [*] Waiting for logs on '" << queue.value << "'. To exit press CTRL+C" << std::endl;
    while (g_running) {
        auto polled = consumer.pollOnce(std::chrono::milliseconds(500));
        if (!polled) {
            std::cerr << "Receive failed: " << polled.message << std::endl;
            return 1;
        }
    }

    auto stats = consumer.getStats();
    std::cout << "Received " << stats.messagesReceived << " messages" << std::endl;
    auto stopped = consumer.stop();
    if (!stopped) {
        std::cerr << "Cancel failed: " << stopped.message << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        po::options_description desc("Logs fanout options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("host", po::value<std::string>(), "Broker host")
            ("port,p", po::value<int>(), "Broker port")
            ("mode,m", po::value<std::string>()->default_value("emit"), "emit or receive")
            ("exchange,e", po::value<std::string>()->default_value("logs"), "Fanout exchange name")
            ("message", po::value<std::vector<std::string>>()->multitoken(), "Messages to emit")
            ("close-code", po::value<int64_t>(), "Reply code sent when closing the channel")
            ("close-reason", po::value<std::string>(), "Reply text sent when closing the channel")
            ("log-level,l", po::value<std::string>()->default_value("warn"), "trace, debug, info, warn, error or off");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        spdlog::set_level(spdlog::level::from_str(vm["log-level"].as<std::string>()));

        ConnectionConfig config;
        std::optional<CloseParams> closeParams;
        if (vm.count("config")) {
            nlohmann::json json = ConfigLoader::loadJsonFromFile(vm["config"].as<std::string>());
            config = ConfigLoader::parseConnectionConfig(json);
            closeParams = ConfigLoader::parseCloseParams(json);
        }
        if (vm.count("host")) {
            config.host = vm["host"].as<std::string>();
        }
        if (vm.count("port")) {
            config.port = vm["port"].as<int>();
        }
        if (vm.count("close-code") || vm.count("close-reason")) {
            std::optional<int64_t> code;
            std::optional<std::string> reason;
            if (vm.count("close-code")) {
                code = vm["close-code"].as<int64_t>();
            }
            if (vm.count("close-reason")) {
                reason = vm["close-reason"].as<std::string>();
            }
            closeParams = closeParamsFrom(code, reason);
        }

        auto connection = std::make_shared<AmqpConnection>(config);
        connection->open();

        auto opened = Channel::open(*connection);
        if (!opened) {
            std::cerr << "Failed to open channel: " << opened.message << std::endl;
            return 1;
        }
        auto channel = opened.value;

        const std::string exchange = vm["exchange"].as<std::string>();
        ExchangeSpec spec;
        spec.name = exchange;
        spec.type = exchangeTypeToString(ExchangeType::Fanout);
        auto declared = channel->declareExchange(spec);
        if (!declared) {
            std::cerr << "Exchange declaration failed: " << declared.message << std::endl;
            return 1;
        }

        int status = 0;
        const std::string mode = vm["mode"].as<std::string>();
        if (mode == "emit") {
            std::vector<std::string> messages{"info: Hello World!"};
            if (vm.count("message")) {
                messages = vm["message"].as<std::vector<std::string>>();
            }
            status = emit(*channel, exchange, messages);
        } else if (mode == "receive") {
            status = receive(channel, exchange);
        } else {
            std::cerr << "Unknown mode: " << mode << std::endl;
            status = 1;
        }

        if (channel->isOpen()) {
            auto closed = channel->close(closeParams);
            if (!closed) {
                std::cerr << "Close failed: " << closed.message << std::endl;
                status = 1;
            }
        }
        connection->close();
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
