#include <catch2/catch_session.hpp>
#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include <tinyroute/util/logger.hpp>
#include <cstdlib>
#include <string>

// Global test event listener to initialize logging
class LoggingInitializer : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(Catch::TestRunInfo const&) override {
        tinyroute::logging::enable();

        // Set log level based on environment variable or default to warn
        const char* log_level_env = std::getenv("TINYROUTE_LOG_LEVEL");
        std::string level_str = log_level_env ? log_level_env : "warn";
        tinyroute::logging::set_log_level(spdlog::level::from_str(level_str));

        LOG_INFO("Test logging initialized. Level: {}", level_str);
    }
};

// Register the listener
CATCH_REGISTER_LISTENER(LoggingInitializer)

// Custom main
int main(int argc, char* argv[]) {
    return Catch::Session().run(argc, argv);
}
