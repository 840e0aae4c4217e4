#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include "AudioEngineDevice.h"
#include "AudioPipeline.h"
#include "../shared/Clock.h"
#include "../shared/Protocol.h"

namespace Parley {

    struct AudioDevice::Impl {
        explicit Impl(AudioPipeline& p) : pipeline(p) {}

        AudioPipeline&   pipeline;
        ma_device        device{};
        ma_device_config config{};
        bool             initialized = false;
        bool             started = false;
    };

    namespace {

        void DataCallback(ma_device* pDevice, void* pOutput, const void* pInput, ma_uint32 frameCount) {
            auto* pipeline = static_cast<AudioPipeline*>(pDevice->pUserData);
            if (!pipeline) return;
            const int64_t nowMs = SteadyClock::Instance().NowMs();
            if (pInput)
                pipeline->ProcessCapture(static_cast<const int16_t*>(pInput), frameCount, nowMs);
            if (pOutput)
                pipeline->ProcessPlayback(static_cast<int16_t*>(pOutput), frameCount, nowMs);
        }

    } // namespace

    AudioDevice::AudioDevice(AudioPipeline& pipeline) : m_Impl(std::make_unique<Impl>(pipeline)) {}

    AudioDevice::~AudioDevice() { Stop(); }

    bool AudioDevice::Start(std::string& error) {
        if (m_Impl->started) return true;

        m_Impl->config = ma_device_config_init(ma_device_type_duplex);
        m_Impl->config.sampleRate = kSampleRate;
        m_Impl->config.capture.channels = kChannels;
        m_Impl->config.playback.channels = kChannels;
        m_Impl->config.capture.format = ma_format_s16;
        m_Impl->config.playback.format = ma_format_s16;
        m_Impl->config.periodSizeInFrames = kFrameSamples;
        m_Impl->config.dataCallback = DataCallback;
        m_Impl->config.pUserData = &m_Impl->pipeline;

        ma_result r = ma_device_init(nullptr, &m_Impl->config, &m_Impl->device);
        if (r != MA_SUCCESS) {
            error = std::string("ma_device_init: ") + ma_result_description(r);
            return false;
        }
        m_Impl->initialized = true;

        r = ma_device_start(&m_Impl->device);
        if (r != MA_SUCCESS) {
            error = std::string("ma_device_start: ") + ma_result_description(r);
            ma_device_uninit(&m_Impl->device);
            m_Impl->initialized = false;
            return false;
        }
        m_Impl->started = true;
        return true;
    }

    void AudioDevice::Stop() {
        if (!m_Impl || !m_Impl->initialized) return;
        if (m_Impl->started) ma_device_stop(&m_Impl->device);
        ma_device_uninit(&m_Impl->device);
        m_Impl->started = false;
        m_Impl->initialized = false;
    }

    bool AudioDevice::IsStarted() const {
        return m_Impl && m_Impl->started;
    }

} // namespace Parley
