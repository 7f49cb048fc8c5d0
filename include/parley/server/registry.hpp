#pragma once

#include <parley/common.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace parley {

    /// Live peers of a server, keyed by "ip:port"
    /// A single mutex guards the map; callers copy out what they need and never
    /// hold the lock across socket calls or callbacks
    template <typename Peer> class PeerRegistry {
      public:
        using PeerPtr = std::shared_ptr<Peer>;

      private:
        std::map<std::string, PeerPtr> peers_;
        mutable std::mutex mutex_;

      public:
        PeerRegistry() { echo::trace("PeerRegistry constructed"); }

        /// Add a peer; error if the identifier is taken
        dp::Res<void> add(const std::string &identifier, PeerPtr peer) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (peers_.find(identifier) != peers_.end()) {
                echo::error("peer already registered: ", identifier.c_str());
                return dp::result::err(dp::Error::invalid_argument("peer already registered"));
            }
            peers_[identifier] = std::move(peer);
            echo::debug("registered peer ", identifier.c_str(), " (", peers_.size(), " total)");
            return dp::result::ok();
        }

        /// Remove a peer; returns it, or null when it was already gone
        PeerPtr remove(const std::string &identifier) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(identifier);
            if (it == peers_.end()) {
                return nullptr;
            }
            PeerPtr peer = std::move(it->second);
            peers_.erase(it);
            echo::debug("deregistered peer ", identifier.c_str(), " (", peers_.size(), " left)");
            return peer;
        }

        /// Remove a peer only if the entry is still this exact object
        bool remove_if_same(const std::string &identifier, const Peer *expected) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(identifier);
            if (it == peers_.end() || it->second.get() != expected) {
                return false;
            }
            peers_.erase(it);
            echo::debug("deregistered peer ", identifier.c_str(), " (", peers_.size(), " left)");
            return true;
        }

        PeerPtr find(const std::string &identifier) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = peers_.find(identifier);
            return it == peers_.end() ? nullptr : it->second;
        }

        dp::Vector<PeerPtr> snapshot() const {
            std::lock_guard<std::mutex> lock(mutex_);
            dp::Vector<PeerPtr> out;
            out.reserve(peers_.size());
            for (const auto &entry : peers_) {
                out.push_back(entry.second);
            }
            return out;
        }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return peers_.size();
        }

        bool contains(const std::string &identifier) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return peers_.find(identifier) != peers_.end();
        }

        /// Empty the registry, returning what it held
        dp::Vector<PeerPtr> drain() {
            std::lock_guard<std::mutex> lock(mutex_);
            dp::Vector<PeerPtr> out;
            for (auto &entry : peers_) {
                out.push_back(std::move(entry.second));
            }
            peers_.clear();
            return out;
        }
    };

} // namespace parley
