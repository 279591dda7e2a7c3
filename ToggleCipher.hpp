#pragma once

#include <unordered_map>
#include <string>

union CipherFeature {
    int i;
    bool b;
};

typedef std::unordered_map<std::string, CipherFeature> CipherFeatureMap;

// Cipher that allows for toggling features on and off.
// The base cipher is the identity.
struct ToggleCipher {
    CipherFeatureMap features; // The cipher keeps a specific feature setting.
    std::string name;
    ToggleCipher() {name = "";};
    ToggleCipher(std::string n) {name = n;};
    virtual ~ToggleCipher() = default;

    // If you were to want to encode/decode with your own feature settings, you can do that here.
    // Any nonspecified features use whatever is in the features map.
    virtual std::string encode_with_features(std::string text, CipherFeatureMap &cfm) {return text;};
    virtual std::string decode_with_features(std::string text, CipherFeatureMap &cfm) {return text;};

    // These encode/decode normally using the stored feature settings.
    CipherFeatureMap blank;
    virtual std::string encode(std::string text);
    virtual std::string decode(std::string text);

    // Lets you change features. Keys the cipher doesn't know about are ignored.
    virtual void set_feature(std::string key, CipherFeature val);
    virtual CipherFeature get_feature(std::string key);
    virtual void reset_features() {};

    virtual std::string cipher_type() {return "identity";};

protected:
    // Value of a feature, preferring the override map over the stored setting.
    int feature_int(const std::string &key, CipherFeatureMap &cfm);
};
