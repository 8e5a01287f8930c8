// meshrtc
#include <base/init.hpp>
#include <server/signaling_server.hpp>

// boost
#include <boost/asio.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include <plog/Log.h>

#include <iostream>

namespace po = boost::program_options;

int main(int argc, const char* argv[]) {
    meshrtc::SignalingServer::Configuration config;
    std::string log_level;

    po::options_description options("meshrtc signaling server");
    options.add_options()
        ("help,h", "print this message")
        ("address,a", po::value<std::string>(&config.address)->default_value(config.address), "listening address")
        ("port,p", po::value<uint16_t>(&config.port)->default_value(config.port), "listening port")
        ("threads,t", po::value<size_t>(&config.num_threads)->default_value(config.num_threads), "number of I/O threads")
        ("log-level,l", po::value<std::string>(&log_level)->default_value("info"), "none, error, warning, info, debug or verbose");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << std::endl << options << std::endl;
        return 1;
    }
    if (vm.count("help")) {
        std::cout << options << std::endl;
        return 0;
    }

    meshrtc::Init(meshrtc::ParseLoggingLevel(log_level, meshrtc::LoggingLevel::INFO));

    meshrtc::SignalingServer server(config);
    try {
        server.Start();
    } catch (const boost::system::system_error& e) {
        PLOG_ERROR << "Failed to listen on " << config.address << ":" << config.port << ": " << e.what();
        return 1;
    }
    PLOG_INFO << "Signaling server listening on " << config.address << ":" << server.port();

    boost::asio::io_context ioc;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        PLOG_INFO << "Shutting down.";
        server.Stop();
    });
    ioc.run();

    return 0;
}
