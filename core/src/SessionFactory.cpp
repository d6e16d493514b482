// Session establishment: one fresh client per session, closed with the session.
#include "smblite/SessionFactory.hpp"
#include "smblite/Log.hpp"
#include "smblite/PathResolver.hpp"

namespace smblite {

Session::Session(SessionFactory& factory, const ConnectionProfile& profile,
                 std::unique_ptr<SmbClient> client, std::string share)
    : factory_(factory), profile_(profile), client_(std::move(client)), share_(std::move(share)) {}

Session::~Session() {
    close();
}

void Session::close() {
    if (client_ && client_->isConnected()) {
        LOGD("closing session to %s/%s", profile_.server.c_str(), share_.c_str());
    }
    if (client_) client_->disconnect();
}

bool Session::reopen(Error& err) {
    LOGW("transport to %s lost, reconnecting", profile_.server.c_str());
    client_->disconnect();
    std::unique_ptr<SmbClient> fresh = factory_.clients_.create();
    if (!fresh) {
        err.set(ErrorKind::Connection, "no protocol client available");
        return false;
    }
    if (!factory_.establish(*fresh, profile_, share_, err)) return false;
    client_ = std::move(fresh);
    return true;
}

Credentials SessionFactory::credentialsFor(const ConnectionProfile& profile) {
    Credentials c;
    if (profile.username.empty() && profile.password.empty()) {
        c.anonymous = true;
        return c;
    }
    c.username = profile.username;
    c.password = profile.password;
    c.domain = profile.domain;
    return c;
}

bool SessionFactory::login(SmbClient& client, const ConnectionProfile& profile, Error& err) {
    std::string e;
    if (!client.connect(profile.server, e)) {
        LOGE("connect to %s failed: %s", profile.server.c_str(), e.c_str());
        err = Error::wrap(ErrorKind::Connection, "cannot reach server " + profile.server,
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }

    const Credentials cred = credentialsFor(profile);
    if (cred.anonymous) {
        LOGD("using guest authentication");
    } else {
        LOGD("authenticating as %s%s%s", cred.domain.c_str(), cred.domain.empty() ? "" : "\\",
             cred.username.c_str());
    }
    if (!client.authenticate(cred, e)) {
        // A logon that lost its transport never got as far as the credentials.
        const bool transportLost = !client.isConnected();
        client.disconnect();
        if (transportLost) {
            LOGE("session setup with %s failed: %s", profile.server.c_str(), e.c_str());
            err = Error::wrap(ErrorKind::Connection, "cannot negotiate with server " + profile.server,
                              Error::make(ErrorKind::Protocol, e));
            return false;
        }
        LOGE("authentication on %s failed: %s", profile.server.c_str(), e.c_str());
        err = Error::wrap(ErrorKind::Authentication,
                          cred.anonymous ? std::string("guest access rejected")
                                         : "credentials rejected for " + cred.username,
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }
    return true;
}

bool SessionFactory::establish(SmbClient& client, const ConnectionProfile& profile,
                               const std::string& share, Error& err) {
    if (!login(client, profile, err)) return false;
    std::string e;
    if (!client.attachShare(share, e)) {
        LOGE("attaching share %s failed: %s", share.c_str(), e.c_str());
        client.disconnect();
        err = Error::wrap(ErrorKind::ShareUnavailable, "share unavailable: " + share,
                          Error::make(ErrorKind::Protocol, e));
        return false;
    }
    return true;
}

bool SessionFactory::open(const ConnectionProfile& profile, std::unique_ptr<Session>& out, Error& err) {
    out.reset();
    if (profile.server.empty()) {
        err.set(ErrorKind::InvalidArgument, "server address is empty");
        return false;
    }
    const std::string share = path::shareName(profile.share);
    if (share.empty()) {
        err.set(ErrorKind::InvalidArgument, "share name is empty");
        return false;
    }
    std::unique_ptr<SmbClient> client = clients_.create();
    if (!client) {
        err.set(ErrorKind::Connection, "no protocol client available");
        return false;
    }
    if (!establish(*client, profile, share, err)) return false;
    LOGD("session open: %s/%s", profile.server.c_str(), share.c_str());
    out.reset(new Session(*this, profile, std::move(client), share));
    return true;
}

bool SessionFactory::probeShares(const ConnectionProfile& profile,
                                 const std::vector<std::string>& candidates,
                                 std::vector<std::string>& out, Error& err) {
    out.clear();
    if (profile.server.empty()) {
        err.set(ErrorKind::InvalidArgument, "server address is empty");
        return false;
    }
    std::unique_ptr<SmbClient> client = clients_.create();
    if (!client) {
        err.set(ErrorKind::Connection, "no protocol client available");
        return false;
    }
    if (!login(*client, profile, err)) return false;
    for (const auto& name : candidates) {
        std::string e;
        if (client->attachShare(name, e)) {
            LOGD("share %s is available", name.c_str());
            out.push_back(name);
        } else {
            LOGD("share %s: %s", name.c_str(), e.c_str());
        }
    }
    client->disconnect();
    return true;
}

} // namespace smblite
