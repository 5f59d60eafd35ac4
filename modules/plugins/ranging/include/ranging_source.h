#ifndef RANGING_SOURCE_H
#define RANGING_SOURCE_H

#include <functional>
#include <optional>
#include <string>

enum class RangingSourceType {
    PRECISE,            // Hardware ranging, samples are metres
    SIGNAL_STRENGTH     // Radio signal strength, samples are dBm
};

const char* ranging_source_type_to_string(RangingSourceType type);

struct RangingCallbacks {
    // peer_id may be empty when the source cannot attribute the sample.
    std::function<void(const std::string& peer_id, double value)> on_sample;
    std::function<void(const std::string& token)> on_local_token;
    std::function<void(const std::string& reason)> on_invalidated;
};

// Boundary to one ranging technology. Callbacks may fire on any thread.
class IRangingSource {
public:
    virtual ~IRangingSource() = default;

    virtual RangingSourceType type() const = 0;
    virtual bool isAvailable() const = 0;
    virtual bool start(RangingCallbacks callbacks, std::string* error) = 0;
    virtual void stop() = 0;

    // Opaque bytes identifying this device for precise sessions. Empty until published.
    virtual std::optional<std::string> localToken() const = 0;
    virtual bool runWithPeerToken(const std::string& peer_id,
                                  const std::string& token,
                                  std::string* error) = 0;
};

#endif // RANGING_SOURCE_H
