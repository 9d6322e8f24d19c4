#ifndef PEERDROP_NETWORK_DATACHANNEL_ENGINE_HPP
#define PEERDROP_NETWORK_DATACHANNEL_ENGINE_HPP

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <rtc/rtc.hpp>
#include "network/rtc_engine.hpp"

namespace peerdrop {
namespace network {

// RtcEngine on top of libdatachannel. One instance is one peer connection.
class DataChannelEngine : public RtcEngine {
public:
    explicit DataChannelEngine(const RtcConfig& config,
                               std::chrono::milliseconds description_timeout = std::chrono::seconds(10));
    ~DataChannelEngine() override;

    SessionDescription create_offer() override;
    SessionDescription create_answer(const SessionDescription& offer) override;
    void set_remote_description(const SessionDescription& description) override;
    void add_ice_candidate(const IceCandidate& candidate) override;

    void on_ice_candidate(CandidateHandler handler) override;
    void on_data_channel_open(ChannelOpenHandler handler) override;
    void on_failure(FailureHandler handler) override;

    void close() override;

private:
    RtcConfig config_;
    std::chrono::milliseconds description_timeout_;
    std::shared_ptr<rtc::PeerConnection> peer_;
    std::shared_ptr<rtc::DataChannel> local_channel_;

    std::mutex mutex_;
    std::optional<std::promise<SessionDescription>> pending_description_;
    CandidateHandler candidate_handler_;
    ChannelOpenHandler open_handler_;
    FailureHandler failure_handler_;
    bool channel_announced_ = false;

    void install_callbacks();
    void watch_channel(std::shared_ptr<rtc::DataChannel> channel);
    void announce_channel(std::shared_ptr<rtc::DataChannel> channel);
    void report_failure(const std::string& reason);
    std::future<SessionDescription> expect_description();
    SessionDescription wait_for(std::future<SessionDescription>& future, const std::string& what);
};

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_DATACHANNEL_ENGINE_HPP
