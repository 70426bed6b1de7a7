// connected_client_view.cpp - Observable list of connected clients for EKrut
// Copyright (C) 2026 DcruBro
// Distributed under the terms of the GNU General Public License, either version 2 only or version 3. See LICENSES/ for details.

#include <ekrut/server/connected_client_view.hpp>
#include <ekrut/common/utils.hpp>

#include <algorithm>
#include <mutex>

namespace EKrut::Server {
    ConnectedClientView::ListenerId ConnectedClientView::subscribe(Listener listener) {
        std::lock_guard lock(mListenerMutex);
        ListenerId id = mNextListenerId++;
        mListeners.emplace(id, std::move(listener));
        return id;
    }

    void ConnectedClientView::unsubscribe(ListenerId id) {
        std::lock_guard lock(mListenerMutex);
        mListeners.erase(id);
    }

    std::vector<ConnectedClient> ConnectedClientView::snapshot() const {
        std::shared_lock lock(mMutex);
        return mClients;
    }

    size_t ConnectedClientView::size() const {
        std::shared_lock lock(mMutex);
        return mClients.size();
    }

    bool ConnectedClientView::contains(const std::string& username) const {
        std::shared_lock lock(mMutex);
        return std::any_of(mClients.begin(), mClients.end(),
            [&](const ConnectedClient& c) { return c.username == username; });
    }

    void ConnectedClientView::mAdd(const ConnectedClient& client) {
        {
            std::unique_lock lock(mMutex);
            mClients.push_back(client);
        }
        mPublish(ViewChange::ADDED, client);
    }

    bool ConnectedClientView::mRemove(const std::string& username) {
        ConnectedClient removed;
        {
            std::unique_lock lock(mMutex);
            auto it = std::find_if(mClients.begin(), mClients.end(),
                [&](const ConnectedClient& c) { return c.username == username; });
            if (it == mClients.end())
                return false;
            removed = *it;
            mClients.erase(it);
        }
        mPublish(ViewChange::REMOVED, removed);
        return true;
    }

    void ConnectedClientView::mPublish(ViewChange change, const ConnectedClient& client) {
        std::lock_guard lock(mListenerMutex);
        for (auto& [id, listener] : mListeners) {
            try {
                listener(change, client);
            } catch (const std::exception& e) {
                Utils::error("Connected client listener " + std::to_string(id) + " threw: " + e.what());
            } catch (...) {
                Utils::error("Connected client listener " + std::to_string(id) + " threw a non-standard exception");
            }
        }
    }
}
