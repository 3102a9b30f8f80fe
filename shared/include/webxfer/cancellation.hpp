#pragma once

#include <memory>

namespace webxfer {

// Read side of a cancellation flag, handed to the I/O paths of a transfer.
class CancellationToken {
    struct State {
        bool requested = false;
    };
    std::shared_ptr<State> state;

public:
    CancellationToken() : state(std::make_shared<State>()) {}

    bool isCancelled() const {
        return this->state && this->state->requested;
    }

    friend class CancellationSource;
};

// Owner side, held by the transfer registry.
class CancellationSource {
    CancellationToken token;

public:
    void cancel() {
        if (this->token.state) {
            this->token.state->requested = true;
        }
    }

    CancellationToken getToken() const {
        return this->token;
    }
};

}
