#pragma once
#include "visionmcp/types.hpp"

#include <mutex>
#include <ostream>

namespace visionmcp::server
{

/// Serializes each envelope as one line. Writers on different threads never
/// interleave partial lines. The stream is assumed always writable.
class OutputSink
{
  public:
    explicit OutputSink(std::ostream& out) : out_(out) {}

    void write(const Json& envelope);

  private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace visionmcp::server
