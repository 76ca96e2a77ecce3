#include <webos/errors.hpp>
#include <webos/protocol/correlation.hpp>

namespace webos
{
namespace protocol
{

CorrelationTable::CorrelationTable() {}

CorrelationTable::~CorrelationTable()
{
    fail_all("Correlation table shutting down");
}

std::pair<std::uint8_t, std::future<CommandResponse>> CorrelationTable::reserve()
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    if (closed_)
        throw ConnectionClosedError(close_reason_);

    if (pending_requests_.size() >= ID_SPACE_SIZE)
        throw TableFullError("All " + std::to_string(ID_SPACE_SIZE) +
                             " request ids are outstanding");

    // At least one id is free, so this terminates within ID_SPACE_SIZE steps
    std::uint8_t id = next_id_;
    while (pending_requests_.count(id) != 0)
        ++id;

    next_id_ = static_cast<std::uint8_t>(id + 1);

    std::promise<CommandResponse> promise;
    auto future = promise.get_future();
    pending_requests_.emplace(id, std::move(promise));

    return {id, std::move(future)};
}

bool CorrelationTable::release(std::uint8_t id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.erase(id) != 0;
}

void CorrelationTable::resolve(CommandResponse response)
{
    std::promise<CommandResponse> promise;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);

        auto it = pending_requests_.find(response.id);
        if (it == pending_requests_.end())
            throw UnmatchedResponseError(
                "No pending request for id " + std::to_string(response.id), response.id);

        promise = std::move(it->second);
        pending_requests_.erase(it);
    }

    // Settled outside the lock; the entry is already gone so this happens exactly once
    promise.set_value(std::move(response));
}

void CorrelationTable::fail_all(const std::string& reason)
{
    std::map<std::uint8_t, std::promise<CommandResponse>> orphaned;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        if (!closed_)
        {
            closed_ = true;
            close_reason_ = reason;
        }
        orphaned.swap(pending_requests_);
    }

    for (auto& [id, promise] : orphaned)
        promise.set_exception(std::make_exception_ptr(ConnectionClosedError(reason)));
}

std::size_t CorrelationTable::pending() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

bool CorrelationTable::is_pending(std::uint8_t id) const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.count(id) != 0;
}

bool CorrelationTable::is_closed() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return closed_;
}

} // namespace protocol
} // namespace webos
