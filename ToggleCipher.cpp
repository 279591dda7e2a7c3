#include "ToggleCipher.hpp"

#include <unordered_map>

std::string ToggleCipher::encode(std::string text) {return encode_with_features(text, blank);}
std::string ToggleCipher::decode(std::string text) {return decode_with_features(text, blank);}

void ToggleCipher::set_feature(std::string key, CipherFeature val) {
    if (features.find(key) != features.end()) features[key] = val;
}

CipherFeature ToggleCipher::get_feature(std::string key) {
    auto it = features.find(key);
    if (it == features.end()) {
        CipherFeature none;
        none.i = 0;
        return none;
    }
    return it->second;
}

int ToggleCipher::feature_int(const std::string &key, CipherFeatureMap &cfm) {
    auto it = cfm.find(key);
    if (it != cfm.end()) return it->second.i;
    return get_feature(key).i;
}
