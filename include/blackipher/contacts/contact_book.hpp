#pragma once
#include "blackipher/core/result.hpp"
#include "blackipher/core/failures.hpp"
#include "blackipher/models/contact_record.hpp"
#include "blackipher/models/keys/one_time_pre_key_public.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
namespace blackipher::protocol::contacts {
using models::ContactRecord;
using models::OneTimePreKeyPublic;
using models::PublicKeyBundle;

/**
 * @brief Public key bundles learned from peers, keyed by peer id.
 *
 * Bundles are stored as given; signature checks happen at agreement time.
 * Get returns a copy taken under the shared lock, so a concurrent
 * LearnBundle is seen either completely or not at all.
 */
class ContactBook {
public:
    ContactBook();

    /// Stores or replaces the record for @p peer_id. The bundle must be
    /// owned by @p peer_id, otherwise InvalidInput.
    [[nodiscard]] Result<Unit, ProtocolFailure> LearnBundle(const std::string& peer_id, PublicKeyBundle bundle);

    [[nodiscard]] std::optional<ContactRecord> Get(const std::string& peer_id) const;

    /// Removes the oldest advertised one-time pre-key from the peer's record
    /// and returns it. Empty when the peer is unknown or has none left.
    [[nodiscard]] std::optional<OneTimePreKeyPublic> ReserveOneTimePreKey(const std::string& peer_id);

    /// Puts back a reserved key that was never used. Dropped when the record
    /// was relearned under another signed pre-key in the meantime.
    bool ReleaseOneTimePreKey(const std::string& peer_id, uint32_t signed_pre_key_id,
                              OneTimePreKeyPublic one_time_pre_key);

    bool Remove(const std::string& peer_id);
    [[nodiscard]] bool Contains(const std::string& peer_id) const;
    [[nodiscard]] std::vector<std::string> ListPeerIds() const;
    [[nodiscard]] size_t Size() const;

    ContactBook(ContactBook&&) noexcept = default;
    ContactBook& operator=(ContactBook&&) noexcept = default;
    ContactBook(const ContactBook&) = delete;
    ContactBook& operator=(const ContactBook&) = delete;
private:
    std::map<std::string, ContactRecord> records_;
    mutable std::unique_ptr<std::shared_mutex> lock_;
};
}
