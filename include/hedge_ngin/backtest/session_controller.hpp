// include/hedge_ngin/backtest/session_controller.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "hedge_ngin/backtest/backtest_runner.hpp"
#include "hedge_ngin/backtest/backtest_types.hpp"
#include "hedge_ngin/backtest/event_stream.hpp"
#include "hedge_ngin/core/config_base.hpp"
#include "hedge_ngin/core/error.hpp"
#include "hedge_ngin/core/thread_pool.hpp"
#include "hedge_ngin/data/market_data_provider.hpp"
#include "hedge_ngin/risk/risk_manager.hpp"
#include "hedge_ngin/signals/producer_registry.hpp"
#include "hedge_ngin/signals/signal_aggregator.hpp"

namespace hedge_ngin {
namespace backtest {

/**
 * @brief Retention of finished sessions in the registry
 */
struct SessionConfig : public ConfigBase {
    long finished_session_ttl_ms{600000};  // Kept this long after reaching a terminal state
    size_t max_finished_sessions{256};     // Oldest finished sessions beyond this are dropped

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["finished_session_ttl_ms"] = finished_session_ttl_ms;
        j["max_finished_sessions"] = max_finished_sessions;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("finished_session_ttl_ms"))
            finished_session_ttl_ms = j.at("finished_session_ttl_ms").get<long>();
        if (j.contains("max_finished_sessions"))
            max_finished_sessions = j.at("max_finished_sessions").get<size_t>();
    }
};

/**
 * @brief Owns every asynchronous backtest session
 *
 * Each started session runs its day loop on a dedicated thread. Producer calls of all
 * sessions share one bounded worker pool. The registry is guarded by a mutex and each
 * session's mutable state by its own mutex.
 *
 * Finished sessions stay queryable for SessionConfig::finished_session_ttl_ms. Each
 * start() reaps sessions past that age (or beyond max_finished_sessions) and joins the
 * threads of every session whose day loop has returned.
 */
class SessionController {
public:
    SessionController(std::shared_ptr<ProducerRegistry> registry,
                      std::shared_ptr<const MarketDataProvider> market_data,
                      AggregatorConfig aggregator_config, RiskConfig risk_config,
                      StreamConfig stream_config, SessionConfig session_config = SessionConfig());

    /**
     * @brief Cancels running sessions and joins their threads
     */
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /**
     * @brief Validate a request, register a pending session and start it
     * @return Session id, or VALIDATION_ERROR
     */
    Result<std::string> start(const BacktestRequest& request);

    /**
     * @return Current view, or NOT_FOUND
     */
    Result<SessionView> status(const std::string& id) const;

    /**
     * @brief Request cooperative cancellation
     *
     * A pending session is cancelled at once. A running one stops at the next day
     * boundary. A terminal session is left untouched.
     *
     * @return View after the request, or NOT_FOUND
     */
    Result<SessionView> cancel(const std::string& id);

    /**
     * @brief Attach a new consumer to a session's event stream
     * @return Subscription (already closed for a terminal session), or NOT_FOUND
     */
    Result<std::shared_ptr<Subscription>> subscribe(const std::string& id);

    /**
     * @brief Detach a consumer
     */
    void unsubscribe(const std::string& id, const std::shared_ptr<Subscription>& subscription);

    /**
     * @brief Run a request on the calling thread without registering a session
     * @return Run outcome (possibly with status failed), or VALIDATION_ERROR
     */
    Result<BacktestRunResult> run_sync(const BacktestRequest& request);

    /**
     * @brief Drop a terminal session from the registry
     * @return NOT_FOUND, or INVALID_STATE_TRANSITION if the session has not finished
     */
    Result<void> remove(const std::string& id);

    /**
     * @brief Join exited session threads and drop expired finished sessions
     * @return Number of sessions dropped from the registry
     */
    size_t reap_finished();

    /**
     * @brief Cancel every session and join all session threads
     */
    void shutdown();

    size_t session_count() const;

    std::vector<SessionView> list_sessions() const;

    const ProducerRegistry& registry() const {
        return *registry_;
    }

private:
    struct Session {
        std::string id;
        BacktestRequest request;
        Timestamp start_time;

        mutable std::mutex mutex;
        SessionStatus status{SessionStatus::PENDING};
        double progress{0.0};
        std::string current_date;
        int completed_days{0};
        int total_days{0};
        std::vector<std::string> warnings;
        std::optional<std::string> error_message;

        std::atomic<bool> cancel_requested{false};
        EventBroadcaster broadcaster;
        std::thread thread;

        // Set as the last act of the session thread; finished_at is written before it
        std::atomic<bool> thread_done{false};
        std::chrono::steady_clock::time_point finished_at;

        Session(std::string session_id, BacktestRequest req, size_t buffer_size)
            : id(std::move(session_id)),
              request(std::move(req)),
              start_time(std::chrono::system_clock::now()),
              broadcaster(buffer_size) {}
    };

    Result<void> validate(const BacktestRequest& request) const;

    /**
     * @brief Move a session to a new status; caller holds session.mutex
     */
    Result<void> transition(Session& session, SessionStatus to) const;

    SessionView make_view(const Session& session) const;

    std::shared_ptr<Session> find(const std::string& id) const;

    std::unique_ptr<BacktestRunner> make_runner(const std::string& id,
                                                const BacktestRequest& request) const;

    void run_session(std::shared_ptr<Session> session);

    /**
     * @brief reap_finished body; caller holds registry_mutex_
     */
    size_t reap_locked();

    std::shared_ptr<ProducerRegistry> registry_;
    std::shared_ptr<const MarketDataProvider> market_data_;
    std::shared_ptr<ThreadPool> pool_;
    std::shared_ptr<const SignalAggregator> aggregator_;
    RiskConfig risk_config_;
    StreamConfig stream_config_;
    SessionConfig session_config_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    bool shutting_down_{false};
};

}  // namespace backtest
}  // namespace hedge_ngin
