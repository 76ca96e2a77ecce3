#ifndef WEBOS_PROTOCOL_CORRELATION_HPP
#define WEBOS_PROTOCOL_CORRELATION_HPP

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <webos/types.hpp>

namespace webos
{
namespace protocol
{

// Request ids are a single byte on the wire
constexpr std::size_t ID_SPACE_SIZE = 256;

// Correlation table - maps in-flight request ids to the promise of their response.
//
// Ids are allocated by probing forward from a cursor and skipping any id that is
// still outstanding, so an id is never handed out twice while live. All state is
// guarded by one mutex that is only held for the map/cursor update itself.
class CorrelationTable
{
  public:
    CorrelationTable();
    ~CorrelationTable();

    // No copy
    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Allocate a free id and register a pending entry for it.
    // Throws TableFullError when every id is outstanding, ConnectionClosedError after fail_all().
    std::pair<std::uint8_t, std::future<CommandResponse>> reserve();

    // Drop the entry for an id whose request will never be answered to its caller
    // (send failed, or the caller stopped waiting). Returns false if the entry was
    // already gone, in which case its promise has been or is being settled.
    bool release(std::uint8_t id);

    // Fulfil and remove the entry matching response.id.
    // Throws UnmatchedResponseError if no entry is live for that id.
    void resolve(CommandResponse response);

    // Settle every pending entry with ConnectionClosedError and refuse new reservations
    void fail_all(const std::string& reason);

    std::size_t pending() const;
    bool is_pending(std::uint8_t id) const;
    bool is_closed() const;

  private:
    // Next id to try; the first request of a connection gets id 1
    std::uint8_t next_id_ = 1;
    bool closed_ = false;
    std::string close_reason_;

    std::map<std::uint8_t, std::promise<CommandResponse>> pending_requests_;
    mutable std::mutex requests_mutex_;
};

} // namespace protocol
} // namespace webos

#endif // WEBOS_PROTOCOL_CORRELATION_HPP
