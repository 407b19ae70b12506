#include "blackipher/contacts/contact_book.hpp"
#include <mutex>

namespace blackipher::protocol::contacts {
    ContactBook::ContactBook()
        : lock_(std::make_unique<std::shared_mutex>()) {
    }

    Result<Unit, ProtocolFailure> ContactBook::LearnBundle(const std::string &peer_id, PublicKeyBundle bundle) {
        if (peer_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Peer id must not be empty"));
        }
        if (bundle.GetOwnerId() != peer_id) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Bundle of '" + bundle.GetOwnerId() +
                                              "' cannot be stored as '" + peer_id + "'"));
        }
        std::unique_lock lock(*lock_);
        records_.insert_or_assign(peer_id, ContactRecord{peer_id, std::move(bundle)});
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    std::optional<ContactRecord> ContactBook::Get(const std::string &peer_id) const {
        std::shared_lock lock(*lock_);
        const auto it = records_.find(peer_id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<OneTimePreKeyPublic> ContactBook::ReserveOneTimePreKey(const std::string &peer_id) {
        std::unique_lock lock(*lock_);
        const auto it = records_.find(peer_id);
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second.bundle.PopOneTimePreKey();
    }

    bool ContactBook::ReleaseOneTimePreKey(
        const std::string &peer_id,
        const uint32_t signed_pre_key_id,
        OneTimePreKeyPublic one_time_pre_key) {
        std::unique_lock lock(*lock_);
        const auto it = records_.find(peer_id);
        if (it == records_.end() || it->second.bundle.GetSignedPreKeyId() != signed_pre_key_id) {
            return false;
        }
        return it->second.bundle.RestoreOneTimePreKey(std::move(one_time_pre_key));
    }

    bool ContactBook::Remove(const std::string &peer_id) {
        std::unique_lock lock(*lock_);
        return records_.erase(peer_id) > 0;
    }

    bool ContactBook::Contains(const std::string &peer_id) const {
        std::shared_lock lock(*lock_);
        return records_.contains(peer_id);
    }

    std::vector<std::string> ContactBook::ListPeerIds() const {
        std::shared_lock lock(*lock_);
        std::vector<std::string> ids;
        ids.reserve(records_.size());
        for (const auto &[peer_id, record] : records_) {
            ids.push_back(peer_id);
        }
        return ids;
    }

    size_t ContactBook::Size() const {
        std::shared_lock lock(*lock_);
        return records_.size();
    }
}
