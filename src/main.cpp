/**
 * HandDeck gesture-to-MIDI controller
 *
 * Reads hand landmarks (one JSON object per line) from stdin, drives two
 * virtual DJ decks and emits MIDI Control Change messages on a virtual
 * port named after midi.port_name.
 *
 * Usage:
 *   hand_tracker | ./handdeck [config.yaml]
 *
 * Runs until stdin closes or SIGINT/SIGTERM.
 */

#include <handdeck/handdeck.h>

#include <iostream>
#include <signal.h>

using namespace handdeck;

// Global flag for clean shutdown
static volatile sig_atomic_t running = 1;

void signalHandler(int signal) {
    (void)signal;
    running = 0;
}

static void installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocked read on stdin returns so the loop can exit
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int main(int argc, char** argv) {
    installSignalHandlers();

    app::Settings settings;
    try {
        if (argc > 1) {
            settings = app::Settings::load_file(argv[1]);
        }
    } catch (const core::ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    auto& logger = core::Logger::getInstance();
    logger.setLevel(settings.logging.level);
    logger.setConsoleOutput(settings.logging.console);
    if (!settings.logging.directory.empty()) {
        if (logger.initializeWithTimestamp(settings.logging.directory, settings.logging.level)) {
            logger.setConsoleOutput(settings.logging.console);
        } else {
            LOG_WARNING("File logging disabled, could not write to " + settings.logging.directory);
        }
    }

    LOG_INFO("HandDeck " + std::string(HANDDECK_VERSION_STRING) + " starting");

    app::GestureMidiController controller(settings);
    try {
        controller.initialize();
    } catch (const core::Exception& e) {
        LOG_CRITICAL(std::string("Fatal: ") + e.what());
        return 1;
    }

    if (!controller.start()) {
        LOG_CRITICAL("Failed to start pipeline: " + controller.get_last_error());
        return 1;
    }

    LOG_INFO("Waiting for landmark stream on stdin");

    gesture::LandmarkStreamReader reader(std::cin);
    gesture::LandmarkFrame frame;
    while (running && reader.next_frame(frame)) {
        controller.process_frame(frame);
    }

    if (!running) {
        LOG_INFO("Interrupted, shutting down");
    } else {
        LOG_INFO("Landmark stream closed, shutting down");
    }

    controller.stop();

    gesture::StreamReaderStats readerStats = reader.get_stats();
    app::ControllerStatistics stats = controller.get_statistics();
    LOG_INFO("Frames: " + std::to_string(stats.frames_processed) +
             ", hands classified: " + std::to_string(stats.hands_classified) +
             ", hands skipped: " + std::to_string(stats.hands_skipped + readerStats.hands_malformed) +
             ", malformed lines: " + std::to_string(readerStats.lines_malformed));
    LOG_INFO("MIDI: sent " + std::to_string(stats.messages_sent) +
             ", toggles " + std::to_string(stats.toggles_sent) +
             ", suppressed by takeover " + std::to_string(stats.suppressed_by_takeover) +
             ", send failures " + std::to_string(stats.send_failures));
    LOG_INFO("Feedback: received " + std::to_string(stats.feedback_received) +
             ", applied " + std::to_string(stats.feedback_applied) +
             ", dropped " + std::to_string(stats.feedback_dropped));
    LOG_INFO("Average processing time: " + std::to_string(stats.avg_processing_time_ms) + " ms/frame");

    logger.flush();
    return 0;
}
