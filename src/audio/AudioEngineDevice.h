#pragma once
#include <memory>
#include <string>

namespace Parley {

    class AudioPipeline;

    // Duplex miniaudio device (s16, mono, 16 kHz, 320-frame periods) driving an
    // AudioPipeline from its data callback.
    class AudioDevice {
    public:
        explicit AudioDevice(AudioPipeline& pipeline);
        ~AudioDevice();

        AudioDevice(const AudioDevice&) = delete;
        AudioDevice& operator=(const AudioDevice&) = delete;

        // On failure returns false and describes the miniaudio error.
        bool Start(std::string& error);
        void Stop();
        bool IsStarted() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_Impl;
    };

} // namespace Parley
