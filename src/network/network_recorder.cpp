#include "network_recorder.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "../utils/logging.hpp"
#include "har.hpp"

namespace network {
    NetworkRecorder::NetworkRecorder(size_t capacity) : capacity_(capacity) {}

    template <typename Event>
    void NetworkRecorder::push_bounded(std::deque<Event>& events, Event evt) {
        events.push_back(std::move(evt));
        if (capacity_ != 0 && events.size() > capacity_) {
            events.pop_front();
        }
    }

    void NetworkRecorder::record_request(RequestEvent evt) {
        if (!enabled_) {
            return;
        }

        LOG_DEBUG("-> %s %s", evt.method_.c_str(), evt.url_.c_str());

        std::lock_guard<std::mutex> lock(mutex_);
        ++total_requests_;
        push_bounded(requests_, std::move(evt));
    }

    void NetworkRecorder::record_response(ResponseEvent evt) {
        if (!enabled_) {
            return;
        }

        evt.ok_ = !evt.error_ && evt.status_ > 0 && evt.status_ < constants::HTTP_ERROR_STATUS_FLOOR;
        LOG_DEBUG("<- %s %ld %s", evt.ok_ ? "ok" : "failed", evt.status_, evt.url_.c_str());

        std::lock_guard<std::mutex> lock(mutex_);
        ++total_responses_;
        if (!evt.ok_) {
            ++failed_responses_;
        }
        push_bounded(responses_, std::move(evt));
    }

    NetworkSummary NetworkRecorder::summary(size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);

        NetworkSummary s{
            .total_requests_ = total_requests_,
            .total_responses_ = total_responses_,
            .failed_responses_ = failed_responses_,
        };

        const size_t req_from = requests_.size() > limit ? requests_.size() - limit : 0;
        s.recent_requests_.assign(requests_.begin() + static_cast<std::ptrdiff_t>(req_from), requests_.end());

        const size_t resp_from = responses_.size() > limit ? responses_.size() - limit : 0;
        s.recent_responses_.assign(responses_.begin() + static_cast<std::ptrdiff_t>(resp_from), responses_.end());

        return s;
    }

    void NetworkRecorder::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
        responses_.clear();
        total_requests_ = 0;
        total_responses_ = 0;
        failed_responses_ = 0;
        LOG_INFO("Network recorder cleared");
    }

    std::string NetworkRecorder::export_trace() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return har::build(requests_, responses_).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    void NetworkRecorder::export_trace_to_file(const std::filesystem::path& path) const {
        const std::string trace = export_trace();

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        auto tmp = path;
        tmp += constants::TEMP_FILE_EXT;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(trace.data(), static_cast<std::streamsize>(trace.size()));
            out.flush();
            if (!out) {
                out.close();
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            const std::string reason = ec.message();
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("rename failed: " + path.string() + ": " + reason);
        }

        LOG_INFO("HAR file exported: %s", path.c_str());
    }
}  // namespace network
