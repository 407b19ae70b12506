#pragma once
#include "blackipher/models/bundles/public_key_bundle.hpp"
#include <string>
namespace blackipher::protocol::models {
struct ContactRecord {
    std::string peer_id;
    PublicKeyBundle bundle;
};
}
