// src/backtest/session_controller.cpp

#include "hedge_ngin/backtest/session_controller.hpp"
#include <algorithm>
#include "hedge_ngin/core/id_generator.hpp"
#include "hedge_ngin/core/logger.hpp"

namespace hedge_ngin {
namespace backtest {

SessionController::SessionController(std::shared_ptr<ProducerRegistry> registry,
                                     std::shared_ptr<const MarketDataProvider> market_data,
                                     AggregatorConfig aggregator_config, RiskConfig risk_config,
                                     StreamConfig stream_config, SessionConfig session_config)
    : registry_(std::move(registry)),
      market_data_(std::move(market_data)),
      risk_config_(std::move(risk_config)),
      stream_config_(std::move(stream_config)),
      session_config_(std::move(session_config)) {
    if (!registry_ || !market_data_) {
        throw HedgeError(ErrorCode::INVALID_ARGUMENT,
                         "Session controller needs a producer registry and market data",
                         "SessionController");
    }
    pool_ = std::make_shared<ThreadPool>(aggregator_config.worker_threads,
                                         aggregator_config.max_queue_size);
    aggregator_ = std::make_shared<SignalAggregator>(pool_, aggregator_config);
}

SessionController::~SessionController() {
    shutdown();
}

Result<void> SessionController::validate(const BacktestRequest& request) const {
    auto basic = request.validate();
    if (basic.is_error()) {
        return basic;
    }
    for (const auto& producer_id : request.selected_signal_producers) {
        if (!registry_->contains(producer_id)) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                    "Unknown signal producer: " + producer_id,
                                    "SessionController");
        }
    }
    return Result<void>();
}

Result<void> SessionController::transition(Session& session, SessionStatus to) const {
    if (!is_valid_transition(session.status, to)) {
        ERROR("Refused transition of " << session.id << " from "
                                       << session_status_to_string(session.status) << " to "
                                       << session_status_to_string(to));
        return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                "Cannot move session from " +
                                    session_status_to_string(session.status) + " to " +
                                    session_status_to_string(to),
                                "SessionController");
    }
    DEBUG(session.id << ": " << session_status_to_string(session.status) << " -> "
                     << session_status_to_string(to));
    session.status = to;
    return Result<void>();
}

SessionView SessionController::make_view(const Session& session) const {
    std::lock_guard<std::mutex> lock(session.mutex);
    SessionView view;
    view.backtest_id = session.id;
    view.status = session.status;
    view.progress = session.progress;
    view.current_date = session.current_date;
    view.error_message = session.error_message;
    view.start_time = session.start_time;
    view.completed_days = session.completed_days;
    view.total_days = session.total_days;
    view.warnings = session.warnings;
    view.request = session.request;
    return view;
}

std::shared_ptr<SessionController::Session> SessionController::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::unique_ptr<BacktestRunner> SessionController::make_runner(
    const std::string& id, const BacktestRequest& request) const {
    auto producers = registry_->resolve(request.selected_signal_producers);
    if (producers.is_error()) {
        throw HedgeError(producers.error()->code(), producers.error()->what(),
                         "SessionController");
    }
    return std::make_unique<BacktestRunner>(id, request, producers.value(), market_data_,
                                            aggregator_, risk_config_);
}

Result<std::string> SessionController::start(const BacktestRequest& request) {
    auto valid = validate(request);
    if (valid.is_error()) {
        return forward_error<std::string>(valid.error());
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (shutting_down_) {
        return make_error<std::string>(ErrorCode::NOT_INITIALIZED,
                                       "Session controller is shutting down",
                                       "SessionController");
    }

    reap_locked();

    std::string id = SessionIdGenerator::generate_session_id();
    while (sessions_.count(id) > 0) {
        id = SessionIdGenerator::generate_session_id();
    }

    auto session =
        std::make_shared<Session>(id, request, stream_config_.subscriber_buffer_size);
    sessions_[id] = session;
    session->thread = std::thread(&SessionController::run_session, this, session);

    INFO("Started backtest " << id << " for " << request.tickers.size() << " tickers from "
                             << request.start_date << " to " << request.end_date);
    return Result<std::string>(id);
}

void SessionController::run_session(std::shared_ptr<Session> session) {
    struct MarkDone {
        Session& session;
        ~MarkDone() {
            session.finished_at = std::chrono::steady_clock::now();
            session.thread_done.store(true);
        }
    } mark_done{*session};

    Logger::register_component(session->id);

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->status != SessionStatus::PENDING) {
            // Cancelled before the first day
            return;
        }
        auto started = transition(*session, SessionStatus::RUNNING);
        if (started.is_error()) {
            return;
        }
    }

    BacktestRunResult result;
    try {
        auto runner = make_runner(session->id, session->request);
        result = runner->run(
            session->cancel_requested,
            [&session](const Event& event) { session->broadcaster.publish(event); },
            [&session](const DayProgress& progress) {
                std::lock_guard<std::mutex> lock(session->mutex);
                session->current_date = progress.current_date;
                session->completed_days = progress.completed_days;
                session->total_days = progress.total_days;
                session->progress = progress.total_days > 0
                                        ? static_cast<double>(progress.completed_days) /
                                              progress.total_days
                                        : 0.0;
                session->warnings.insert(session->warnings.end(), progress.new_warnings.begin(),
                                         progress.new_warnings.end());
            });
    } catch (const std::exception& e) {
        ERROR("Backtest " << session->id << " could not run: " << e.what());
        result.status = SessionStatus::FAILED;
        result.error_message = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto finished = transition(*session, result.status);
        if (finished.is_error()) {
            Logger::register_component("");
            return;
        }
        session->total_days = result.total_days;
        if (result.status == SessionStatus::COMPLETED) {
            session->completed_days = result.total_days;
            session->progress = 1.0;
        }
        if (result.status == SessionStatus::FAILED) {
            session->error_message = result.error_message.value_or("Backtest failed");
        }
        session->warnings = result.warnings;
    }

    session->broadcaster.publish(BacktestRunner::terminal_event(session->id, result));
    INFO("Backtest " << session->id << " finished with status "
                     << session_status_to_string(result.status));
    Logger::register_component("");
}

Result<SessionView> SessionController::status(const std::string& id) const {
    auto session = find(id);
    if (!session) {
        return make_error<SessionView>(ErrorCode::NOT_FOUND, "Backtest not found: " + id,
                                       "SessionController");
    }
    return Result<SessionView>(make_view(*session));
}

Result<SessionView> SessionController::cancel(const std::string& id) {
    auto session = find(id);
    if (!session) {
        return make_error<SessionView>(ErrorCode::NOT_FOUND, "Backtest not found: " + id,
                                       "SessionController");
    }

    bool cancelled_before_start = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (is_terminal(session->status)) {
            DEBUG("Cancel of finished backtest " << id << " ignored");
        } else {
            session->cancel_requested.store(true);
            if (session->status == SessionStatus::PENDING) {
                auto cancelled = transition(*session, SessionStatus::CANCELLED);
                cancelled_before_start = cancelled.is_ok();
            }
        }
    }

    if (cancelled_before_start) {
        BacktestRunResult result;
        result.status = SessionStatus::CANCELLED;
        result.final_portfolio.cash = session->request.initial_cash;
        result.performance_metrics =
            PerformanceCalculator().calculate({}, session->request.initial_cash);
        session->broadcaster.publish(BacktestRunner::terminal_event(id, result));
        INFO("Backtest " << id << " cancelled before its first day");
    } else {
        INFO("Cancellation requested for backtest " << id);
    }

    return Result<SessionView>(make_view(*session));
}

Result<std::shared_ptr<Subscription>> SessionController::subscribe(const std::string& id) {
    auto session = find(id);
    if (!session) {
        return make_error<std::shared_ptr<Subscription>>(
            ErrorCode::NOT_FOUND, "Backtest not found: " + id, "SessionController");
    }
    return Result<std::shared_ptr<Subscription>>(session->broadcaster.subscribe());
}

void SessionController::unsubscribe(const std::string& id,
                                    const std::shared_ptr<Subscription>& subscription) {
    auto session = find(id);
    if (session) {
        session->broadcaster.unsubscribe(subscription);
    }
}

Result<BacktestRunResult> SessionController::run_sync(const BacktestRequest& request) {
    auto valid = validate(request);
    if (valid.is_error()) {
        return forward_error<BacktestRunResult>(valid.error());
    }

    std::string id = SessionIdGenerator::generate_session_id();
    try {
        auto runner = make_runner(id, request);
        std::atomic<bool> never_cancelled{false};
        return Result<BacktestRunResult>(runner->run(never_cancelled, nullptr));
    } catch (const std::exception& e) {
        return make_error<BacktestRunResult>(ErrorCode::UNKNOWN_ERROR,
                                             std::string("Backtest failed: ") + e.what(),
                                             "SessionController");
    }
}

Result<void> SessionController::remove(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return make_error<void>(ErrorCode::NOT_FOUND, "Backtest not found: " + id,
                                    "SessionController");
        }
        {
            std::lock_guard<std::mutex> session_lock(it->second->mutex);
            if (!is_terminal(it->second->status)) {
                return make_error<void>(ErrorCode::INVALID_STATE_TRANSITION,
                                        "Backtest " + id + " is still " +
                                            session_status_to_string(it->second->status),
                                        "SessionController");
            }
        }
        session = it->second;
        sessions_.erase(it);
    }

    if (session->thread.joinable()) {
        session->thread.join();
    }
    DEBUG("Removed backtest " << id);
    return Result<void>();
}

size_t SessionController::reap_finished() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return reap_locked();
}

size_t SessionController::reap_locked() {
    const auto now = std::chrono::steady_clock::now();
    const auto ttl = std::chrono::milliseconds(session_config_.finished_session_ttl_ms);

    std::vector<std::shared_ptr<Session>> finished;
    for (auto& entry : sessions_) {
        auto& session = entry.second;
        if (!session->thread_done.load()) {
            continue;
        }
        // The thread has already returned, so this join does not block
        if (session->thread.joinable()) {
            session->thread.join();
        }
        finished.push_back(session);
    }

    std::sort(finished.begin(), finished.end(),
              [](const std::shared_ptr<Session>& a, const std::shared_ptr<Session>& b) {
                  return a->finished_at < b->finished_at;
              });

    size_t dropped = 0;
    for (size_t i = 0; i < finished.size(); ++i) {
        const bool expired = now - finished[i]->finished_at >= ttl;
        const bool over_cap = finished.size() - i > session_config_.max_finished_sessions;
        if (!expired && !over_cap) {
            continue;
        }
        finished[i]->broadcaster.close();
        sessions_.erase(finished[i]->id);
        ++dropped;
    }

    if (dropped > 0) {
        DEBUG("Reaped " << dropped << " finished backtests");
    }
    return dropped;
}

void SessionController::shutdown() {
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (shutting_down_ && sessions_.empty()) {
            return;
        }
        shutting_down_ = true;
        sessions.swap(sessions_);
    }

    for (auto& entry : sessions) {
        entry.second->cancel_requested.store(true);
    }
    for (auto& entry : sessions) {
        if (entry.second->thread.joinable()) {
            entry.second->thread.join();
        }
        entry.second->broadcaster.close();
    }

    if (pool_) {
        pool_->shutdown();
    }
    if (!sessions.empty()) {
        INFO("Session controller stopped " << sessions.size() << " sessions");
    }
}

size_t SessionController::session_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

std::vector<SessionView> SessionController::list_sessions() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }
    std::vector<SessionView> views;
    views.reserve(sessions.size());
    for (const auto& session : sessions) {
        views.push_back(make_view(*session));
    }
    return views;
}

}  // namespace backtest
}  // namespace hedge_ngin
