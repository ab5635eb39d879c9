#include "chunkfs/daemon/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using chunkfs::daemon::StructuredLogger;
using chunkfs::daemon::log_event;

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_stream(&sink);
    logger.set_enabled(true);
    logger.set_component("node");
    logger.set_minimum_level(StructuredLogger::Level::Info);

    log_event(StructuredLogger::Level::Info, "node.chunk.stored", {{"chunk_id", "17_0"}, {"bytes", "42"}});
    const auto line = sink.str();
    assert(line.front() == '{');
    assert(line.back() == '\n');
    assert(line.find("\"level\":\"info\"") != std::string::npos);
    assert(line.find("\"component\":\"node\"") != std::string::npos);
    assert(line.find("\"event\":\"node.chunk.stored\"") != std::string::npos);
    assert(line.find("\"fields\":{\"chunk_id\":\"17_0\",\"bytes\":\"42\"}") != std::string::npos);
    assert(line.find("\"ts\":\"") != std::string::npos);

    // Quotes, backslashes and control characters stay on one line.
    sink.str("");
    log_event(StructuredLogger::Level::Warning, "client.upload.incomplete", {{"filename", "a\"b\\c\nd\x01"}});
    const auto escaped = sink.str();
    assert(escaped.find("a\\\"b\\\\c\\nd\\u0001") != std::string::npos);
    assert(escaped.find('\n') == escaped.size() - 1);

    sink.str("");
    logger.set_minimum_level(StructuredLogger::Level::Error);
    log_event(StructuredLogger::Level::Warning, "suppressed");
    assert(sink.str().empty());
    log_event(StructuredLogger::Level::Error, "rpc.request.failed");
    assert(sink.str().find("\"level\":\"error\"") != std::string::npos);

    sink.str("");
    logger.set_enabled(false);
    assert(!logger.enabled());
    log_event(StructuredLogger::Level::Error, "disabled");
    assert(sink.str().empty());

    logger.set_stream(nullptr);
    return 0;
}
