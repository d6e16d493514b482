// Opens one short-lived protocol session (connect -> authenticate -> attach share)
// per logical operation. A Session owns its client and closes it on destruction.
#pragma once
#include "Error.hpp"
#include "SmbClient.hpp"
#include <memory>

namespace smblite {

class SessionFactory;

class Session {
public:
    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    SmbClient& client() { return *client_; }
    const ConnectionProfile& profile() const { return profile_; }
    // Share name as attached (already stripped of separators).
    const std::string& share() const { return share_; }

    // Closes the current connection, then establishes a new one with the same
    // profile. Used after the transport dropped in the middle of a transfer.
    bool reopen(Error& err);

    void close();

private:
    friend class SessionFactory;
    Session(SessionFactory& factory, const ConnectionProfile& profile,
            std::unique_ptr<SmbClient> client, std::string share);

    SessionFactory& factory_;
    ConnectionProfile profile_;
    std::unique_ptr<SmbClient> client_;
    std::string share_;
};

class SessionFactory {
public:
    explicit SessionFactory(SmbClientFactory& clients) : clients_(clients) {}

    // Fails with Connection, Authentication or ShareUnavailable depending on
    // which establishment step was refused.
    bool open(const ConnectionProfile& profile, std::unique_ptr<Session>& out, Error& err);

    // Logs in once and returns which of the candidate shares can be attached.
    // Uses a single client that is closed before returning.
    bool probeShares(const ConnectionProfile& profile,
                     const std::vector<std::string>& candidates,
                     std::vector<std::string>& out, Error& err);

    // Guest identity when both username and password are empty.
    static Credentials credentialsFor(const ConnectionProfile& profile);

private:
    friend class Session;
    // connect + authenticate
    bool login(SmbClient& client, const ConnectionProfile& profile, Error& err);
    bool establish(SmbClient& client, const ConnectionProfile& profile,
                   const std::string& share, Error& err);

    SmbClientFactory& clients_;
};

} // namespace smblite
