#include "CallSession.hpp"

#include <spdlog/spdlog.h>

#include <deque>
#include <exception>
#include <utility>
#include <vector>

#include "Errors.hpp"
#include "LiveMessages.hpp"
#include "TelephonyMessages.hpp"
#include "ToolDispatcher.hpp"
#include "Transcoder.hpp"
#include "Types.hpp"

namespace voxbridge {

const char* to_string(CallState state) {
    switch (state) {
        case CallState::Idle:
            return "Idle";
        case CallState::Connecting:
            return "Connecting";
        case CallState::Active:
            return "Active";
        case CallState::Closing:
            return "Closing";
        case CallState::Closed:
            return "Closed";
    }
    return "Unknown";
}

// =========================================================
//  CallSession Implementation (PIMPL)
// =========================================================

struct CallSession::Impl {
    CallSession& owner_;
    asio::any_io_executor executor_;
    std::string id_;
    std::string stream_sid_;

    std::shared_ptr<ITelephonyChannel> telephony_;
    std::shared_ptr<ILiveChannel> live_;
    std::shared_ptr<const ToolDispatcher> tools_;
    std::shared_ptr<ISessionObserver> observer_;
    std::function<void(const std::string&)> on_closed_;

    CallSessionConfig cfg_;
    audio::Transcoder transcoder_;

    CallState state_ = CallState::Idle;
    // Caller audio that arrived before the AI session was ready (oldest first).
    std::deque<std::vector<uint8_t>> pending_audio_;
    size_t dropped_pending_ = 0;
    size_t tools_in_flight_ = 0;

    Impl(CallSession& owner, asio::any_io_executor executor, std::string id,
         std::shared_ptr<ITelephonyChannel> telephony, std::shared_ptr<ILiveChannel> live,
         std::shared_ptr<const ToolDispatcher> tools, CallSessionConfig cfg)
        : owner_(owner),
          executor_(std::move(executor)),
          id_(std::move(id)),
          telephony_(std::move(telephony)),
          live_(std::move(live)),
          tools_(std::move(tools)),
          cfg_(std::move(cfg)),
          transcoder_(cfg_.audio) {
        spdlog::debug("[{}] Call session created.", id_);
    }

    bool finished() const { return state_ == CallState::Closing || state_ == CallState::Closed; }

    void Transition(CallState next) {
        if (state_ == next) return;
        const auto prev = state_;
        state_ = next;
        if (observer_) {
            observer_->OnStateChanged(id_, prev, next);
        }
    }

    void ReportError(const std::string& message) {
        if (observer_) {
            observer_->OnError(id_, message);
        } else {
            spdlog::error("[{}] {}", id_, message);
        }
    }

    // --- Telephony side ---

    void HandleTelephony(std::string_view text) {
        if (finished()) return;

        models::TelephonyEvent event;
        try {
            event = models::ParseTelephonyMessage(text);
        } catch (const MalformedFrameError& e) {
            spdlog::warn("[{}] Dropping telephony message: {}", id_, e.what());
            return;
        }

        switch (event.kind) {
            case models::TelephonyEventKind::Connected:
                spdlog::debug("[{}] Telephony stream connected", id_);
                break;
            case models::TelephonyEventKind::Start:
                HandleStart(event);
                break;
            case models::TelephonyEventKind::Media:
                HandleMedia(std::move(event.payload));
                break;
            case models::TelephonyEventKind::Stop:
                spdlog::info("[{}] Telephony stream stopped", id_);
                BeginClose("telephony stop");
                break;
            case models::TelephonyEventKind::Mark:
            case models::TelephonyEventKind::Unknown:
                spdlog::debug("[{}] Ignoring telephony event '{}'", id_, event.event_name);
                break;
        }
    }

    void HandleStart(const models::TelephonyEvent& event) {
        if (state_ != CallState::Idle) {
            spdlog::warn("[{}] Duplicate start event ignored", id_);
            return;
        }

        stream_sid_ = event.stream_sid;
        spdlog::info("[{}] Stream {} started (call {})", id_, stream_sid_,
                     event.call_sid.empty() ? "-" : event.call_sid);
        Transition(CallState::Connecting);

        live_->Open(owner_.weak_from_this());

        // The live channel holds these until its handshake is done.
        const json::array declarations = tools_ ? tools_->Declarations() : json::array{};
        live_->Send(models::BuildSetupMessage(cfg_.live, declarations));
        if (cfg_.live.kickstart) {
            live_->Send(models::BuildClientContent("user", cfg_.live.kickstart_text, true));
        }
    }

    void HandleMedia(std::vector<uint8_t> mulaw) {
        switch (state_) {
            case CallState::Idle:
                spdlog::trace("[{}] Media before start dropped", id_);
                return;
            case CallState::Connecting:
                Enqueue(std::move(mulaw));
                return;
            case CallState::Active:
                ForwardCallerAudio(mulaw);
                return;
            default:
                return;
        }
    }

    void Enqueue(std::vector<uint8_t> mulaw) {
        if (cfg_.pending_audio_frames == 0) {
            ++dropped_pending_;
            return;
        }
        if (pending_audio_.size() >= cfg_.pending_audio_frames) {
            pending_audio_.pop_front();
            if (dropped_pending_++ == 0) {
                spdlog::warn("[{}] AI session not ready, dropping oldest caller audio", id_);
            }
        }
        pending_audio_.push_back(std::move(mulaw));
    }

    void FlushPending() {
        if (pending_audio_.empty()) return;
        spdlog::debug("[{}] Flushing {} buffered frames ({} dropped)", id_, pending_audio_.size(),
                      dropped_pending_);
        while (!pending_audio_.empty()) {
            ForwardCallerAudio(pending_audio_.front());
            pending_audio_.pop_front();
        }
    }

    void ForwardCallerAudio(const std::vector<uint8_t>& mulaw) {
        if (mulaw.empty()) return;
        live_->Send(models::BuildRealtimeInput(transcoder_.TelephonyFrameToAIChunk(mulaw)));
    }

    // --- AI side ---

    // The setup message went out first on this connection, so caller audio may
    // follow from now on.
    void HandleLiveOpen() {
        if (state_ != CallState::Connecting) return;
        spdlog::info("[{}] AI session open", id_);
        Transition(CallState::Active);
        FlushPending();
    }

    void HandleLive(std::string_view text) {
        if (finished()) return;

        models::LiveServerMessage msg;
        try {
            msg = models::ParseLiveServerMessage(text);
        } catch (const MalformedFrameError& e) {
            spdlog::warn("[{}] Dropping AI message: {}", id_, e.what());
            return;
        }

        if (msg.setup_complete) {
            spdlog::debug("[{}] AI setup acknowledged", id_);
        }

        for (auto& part : msg.parts) {
            if (!part.text.empty() && observer_) {
                observer_->OnTranscript(id_, Speaker::Assistant, part.text);
            }
            if (part.audio) {
                ForwardAssistantAudio(*part.audio);
            }
        }

        if (msg.interrupted) {
            spdlog::debug("[{}] Caller interrupted, clearing playback", id_);
            telephony_->Send(models::BuildTelephonyClear(stream_sid_));
        }

        for (auto& call : msg.tool_calls) {
            SpawnToolCall(std::move(call));
        }

        for (const auto& cancelled : msg.cancelled_tool_call_ids) {
            spdlog::info("[{}] AI cancelled tool call {}", id_, cancelled);
        }

        if (msg.go_away) {
            spdlog::info("[{}] AI session is going away", id_);
            BeginClose("AI goAway");
        }
    }

    void ForwardAssistantAudio(const audio::AudioChunk& chunk) {
        if (stream_sid_.empty()) return;
        try {
            auto frame = transcoder_.AIChunkToTelephonyFrame(chunk.data);
            if (!frame.empty()) {
                telephony_->Send(models::BuildTelephonyMedia(stream_sid_, frame));
            }
        } catch (const MalformedFrameError& e) {
            spdlog::warn("[{}] Dropping AI audio chunk: {}", id_, e.what());
        }
    }

    // --- Tools ---

    static models::ToolResponse ErrorResponse(const models::ToolCall& call, const std::string& what) {
        boost::json::object result;
        result["error"] = what;
        return {call.id, call.name, std::move(result)};
    }

    void SpawnToolCall(models::ToolCall call) {
        if (observer_) {
            observer_->OnToolCall(id_, call.name, call.args);
        }
        if (!tools_) {
            ReportError("Tool call '" + call.name + "' received but no tools are configured");
            SendToolResponse(ErrorResponse(call, "No tools are available"));
            return;
        }

        ++tools_in_flight_;
        // The coroutine holds the session, so a result can outlive the call and
        // still be recognized as late.
        asio::co_spawn(
            executor_,
            [self = owner_.shared_from_this(), tools = tools_,
             call = std::move(call)]() mutable -> asio::awaitable<void> {
                const models::ToolCall header{call.id, call.name, {}};
                models::ToolResponse response;
                try {
                    response = co_await tools->Dispatch(std::move(call));
                } catch (const std::exception& e) {
                    self->pImpl_->ReportError("Tool " + header.name + " failed: " + e.what());
                    response = ErrorResponse(header, e.what());
                }
                self->pImpl_->FinishToolCall(std::move(response));
            },
            asio::detached);
    }

    void FinishToolCall(models::ToolResponse response) {
        --tools_in_flight_;
        if (state_ == CallState::Closed) {
            spdlog::info("[{}] Call ended before tool {} finished, result discarded", id_,
                         response.name);
            return;
        }
        SendToolResponse(std::move(response));
    }

    // Exactly one of these goes out per tool call while the call is open.
    void SendToolResponse(models::ToolResponse response) {
        try {
            if (observer_) {
                observer_->OnToolResult(id_, response.name, response.result);
                if (response.schedule_changed) {
                    observer_->OnScheduleChanged(id_);
                }
            }
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Session observer failed on tool {}: {}", id_, response.name, e.what());
        }
        live_->Send(models::BuildToolResponse({response}));
    }

    // --- Teardown ---

    void BeginClose(const std::string& reason) {
        if (finished()) return;

        spdlog::info("[{}] Closing call: {}", id_, reason);
        Transition(CallState::Closing);

        pending_audio_.clear();
        telephony_->Close();
        live_->Close();

        Transition(CallState::Closed);
        if (on_closed_) {
            auto handler = std::move(on_closed_);
            on_closed_ = nullptr;
            handler(id_);
        }
    }

    void HandleLiveClosed(const std::string& reason) {
        if (finished()) return;
        if (state_ == CallState::Connecting) {
            ReportError("AI session closed before setup completed: " + reason);
        }
        BeginClose("AI connection closed: " + reason);
    }
};

// =========================================================
//  CallSession Wrapper
// =========================================================

CallSession::CallSession(asio::any_io_executor executor, std::string call_id,
                         std::shared_ptr<ITelephonyChannel> telephony, std::shared_ptr<ILiveChannel> live,
                         std::shared_ptr<const ToolDispatcher> tools, CallSessionConfig cfg)
    : pImpl_(std::make_unique<Impl>(*this, std::move(executor), std::move(call_id), std::move(telephony),
                                    std::move(live), std::move(tools), std::move(cfg))) {}

CallSession::~CallSession() = default;

void CallSession::Start() {
    pImpl_->telephony_->Start(weak_from_this());
}

void CallSession::Stop() {
    asio::post(pImpl_->executor_,
               [self = shared_from_this()] { self->pImpl_->BeginClose("server shutdown"); });
}

void CallSession::AttachObserver(std::shared_ptr<ISessionObserver> observer) {
    pImpl_->observer_ = std::move(observer);
}

void CallSession::SetCloseHandler(std::function<void(const std::string&)> handler) {
    pImpl_->on_closed_ = std::move(handler);
}

const std::string& CallSession::id() const noexcept {
    return pImpl_->id_;
}

const std::string& CallSession::stream_sid() const noexcept {
    return pImpl_->stream_sid_;
}

CallState CallSession::state() const noexcept {
    return pImpl_->state_;
}

std::size_t CallSession::pending_audio_frames() const noexcept {
    return pImpl_->pending_audio_.size();
}

std::size_t CallSession::tool_calls_in_flight() const noexcept {
    return pImpl_->tools_in_flight_;
}

void CallSession::OnTelephonyMessage(std::string_view text) {
    pImpl_->HandleTelephony(text);
}

void CallSession::OnTelephonyClosed(const std::string& reason) {
    pImpl_->BeginClose("telephony closed: " + reason);
}

void CallSession::OnLiveOpen() {
    pImpl_->HandleLiveOpen();
}

void CallSession::OnLiveMessage(std::string_view text) {
    pImpl_->HandleLive(text);
}

void CallSession::OnLiveClosed(const std::string& reason) {
    pImpl_->HandleLiveClosed(reason);
}

}  // namespace voxbridge
