#pragma once
// CancellationToken.hpp
// Cooperative cancellation flag shared between a caller and a running ingestion.

#include <atomic>
#include <string>
#include "Errors.hpp"

class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool is_cancelled() const { return cancelled_; }

    // Throws IngestionCancelled when cancel() has been called
    void throw_if_cancelled(const std::string& where) const {
        if (cancelled_) {
            throw IngestionCancelled("cancelled during " + where);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};
