#include "visionmcp/server/output_sink.hpp"

#include "visionmcp/util/json.hpp"

namespace visionmcp::server
{

void OutputSink::write(const Json& envelope)
{
    // Serialize outside the lock; only the stream write is serialized.
    std::string line = util::json::dump(envelope);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.flush();
}

} // namespace visionmcp::server
