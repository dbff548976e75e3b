// ============================================================================
// fanout/execution/stop_token_adapter.hpp - stop_token <-> CancellationToken
// ============================================================================
//
// Bidirectional bridge between std::stop_token and fanout::CancellationToken,
// for callers whose cancellation already lives in std::jthread or P2300
// code.
//
// USAGE:
// ------
//   // std::stop_token -> CancellationToken
//   std::jthread worker([&pool, tasks](std::stop_token st) mutable {
//       auto [token, bridge] = fanout::execution::FromStopToken(st);
//       auto results = RunBatch(pool, std::move(tasks), token);
//   });
//
//   // CancellationToken -> std::stop_source
//   CancellationSource source;
//   std::stop_source ss;
//   auto link = fanout::execution::LinkCancellation(source.GetToken(), ss);
//   source.Cancel();   // ss.stop_requested() is now true
//
// A stop request carries no reason; tokens fed from a std::stop_token are
// cancelled with CancelReason::Explicit.
//
// ============================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>

#include "fanout/core/cancellation.hpp"

namespace fanout::execution {

// ============================================================================
// FromStopToken - std::stop_token -> CancellationToken
// ============================================================================

class StopTokenBridge {
   public:
    explicit StopTokenBridge(std::stop_token st) {
        if (st.stop_possible()) {
            // Fires inline if a stop was already requested
            callback_.emplace(std::move(st), [this] { source_.Cancel(CancelReason::Explicit); });
        }
    }

    StopTokenBridge(const StopTokenBridge&) = delete;
    StopTokenBridge& operator=(const StopTokenBridge&) = delete;

    [[nodiscard]] CancellationToken GetToken() const { return source_.GetToken(); }

   private:
    CancellationSource source_;
    std::optional<std::stop_callback<std::function<void()>>> callback_;
};

// The token stays usable after the bridge is gone; it just stops following
// the stop_token.
struct StopTokenBridgeHandle {
    CancellationToken token;
    std::shared_ptr<StopTokenBridge> bridge;
};

inline StopTokenBridgeHandle FromStopToken(std::stop_token st) {
    auto bridge = std::make_shared<StopTokenBridge>(std::move(st));
    auto token = bridge->GetToken();
    return {std::move(token), std::move(bridge)};
}

// ============================================================================
// LinkCancellation - CancellationToken -> std::stop_source
// ============================================================================
// The returned handle unregisters on destruction; keep it alive for as long
// as the link should hold.

class CancellationLink {
   public:
    CancellationLink(CancellationToken token, std::stop_source source) : token_(std::move(token)) {
        handle_ = token_.OnCancel([s = std::move(source)]() mutable { s.request_stop(); });
    }

    ~CancellationLink() { token_.Unregister(handle_); }

    CancellationLink(const CancellationLink&) = delete;
    CancellationLink& operator=(const CancellationLink&) = delete;
    CancellationLink(CancellationLink&&) = delete;
    CancellationLink& operator=(CancellationLink&&) = delete;

   private:
    CancellationToken token_;
    size_t handle_ = 0;
};

inline std::unique_ptr<CancellationLink> LinkCancellation(CancellationToken token, std::stop_source source) {
    return std::make_unique<CancellationLink>(std::move(token), std::move(source));
}

}  // namespace fanout::execution
