#pragma once

#include "protocol/Client.hpp"

#include <string>

namespace mg::cloud {

class CloudClient : public protocol::Client {
public:
    [[nodiscard]] types::Protocol protocol() const override { return types::Protocol::Cloud; }

    [[nodiscard]] virtual const std::string& provider() const = 0;

    // Silent: uses stored refresh state only, never prompts.
    virtual types::VoidResult authenticate() = 0;

    // No I/O.
    [[nodiscard]] virtual bool isAuthenticated() const = 0;

    virtual void signOut() = 0;

    // Restores a session from encrypted local storage. True when the client is usable afterwards.
    virtual bool tryRestoreSession() = 0;
};

}
