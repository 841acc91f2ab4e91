// Copyright (c) 2026, WH, All rights reserved.
#pragma once

#ifndef SDL3BIND_AUDIO_H
#define SDL3BIND_AUDIO_H

#include "AudioApi.h"
#include "Errors.h"
#include "Handle.h"

#include <SDL3/SDL_audio.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace sdl3bind::audio {

class OpenedDevice;
class Stream;

// a physical or default device, just an id (0 is never valid)
class Device {
   public:
    constexpr explicit Device(SDL_AudioDeviceID id) noexcept : m_id(id) {}

    // follow whatever the system default is, even when it changes
    [[nodiscard]] static constexpr Device defaultPlayback() noexcept {
        return Device{SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK};
    }
    [[nodiscard]] static constexpr Device defaultRecording() noexcept {
        return Device{SDL_AUDIO_DEVICE_DEFAULT_RECORDING};
    }

    [[nodiscard]] static Result<std::vector<Device>> getPlaybackDevices();
    [[nodiscard]] static Result<std::vector<Device>> getRecordingDevices();

    [[nodiscard]] constexpr SDL_AudioDeviceID id() const noexcept { return m_id; }

    [[nodiscard]] Result<std::string_view> getName() const noexcept;

    struct Format {
        AudioSpec spec;
        int sample_frames{0};
        bool operator==(const Format &) const = default;
    };
    // the preferred format of physical devices, the current one of opened devices
    [[nodiscard]] Result<Format> getFormat() const noexcept;

    // nothing = a reasonable default
    [[nodiscard]] Result<OpenedDevice> open(const std::optional<AudioSpec> &spec = std::nullopt) const noexcept;

    bool operator==(const Device &) const = default;

   private:
    SDL_AudioDeviceID m_id;
};

// a logical device, closed on destruction
class OpenedDevice {
    NOCOPY(OpenedDevice)
   public:
    explicit OpenedDevice(SDL_AudioDeviceID id) noexcept : m_handle(id) {}
    OpenedDevice(OpenedDevice &&) noexcept = default;
    OpenedDevice &operator=(OpenedDevice &&) noexcept = default;
    ~OpenedDevice() = default;

    [[nodiscard]] SDL_AudioDeviceID id() const noexcept { return m_handle.get(); }
    [[nodiscard]] Device device() const noexcept { return Device{id()}; }

    Result<void> pause() const noexcept;
    Result<void> resume() const noexcept;
    [[nodiscard]] bool paused() const noexcept;

    [[nodiscard]] Result<float> getGain() const noexcept;
    Result<void> setGain(float gain) const noexcept;

    Result<void> bindStream(const Stream &stream) const noexcept;

    [[nodiscard]] SDL_AudioDeviceID release() noexcept { return m_handle.release(); }

   private:
    UniqueId<SDL_AudioDeviceID, SDL_CloseAudioDevice> m_handle;
};

// converts/buffers between two formats, unbinds itself on destruction
class Stream {
    NOCOPY(Stream)
   public:
    [[nodiscard]] static Result<Stream> create(const AudioSpec &src, const AudioSpec &dst) noexcept;

    // opens the device, binds a new stream to it and leaves the device paused.
    // the device closes when the stream is destroyed
    [[nodiscard]] static Result<Stream> openDeviceStream(Device device,
                                                         const std::optional<AudioSpec> &spec = std::nullopt) noexcept;

    Stream(Stream &&) noexcept = default;
    Stream &operator=(Stream &&) noexcept = default;
    ~Stream() = default;

    [[nodiscard]] SDL_AudioStream *get() const noexcept { return m_stream.get(); }

    Result<void> putData(std::span<const std::byte> data) const noexcept;
    // bytes read, can be less than requested
    [[nodiscard]] Result<int> getData(std::span<std::byte> out) const noexcept;
    [[nodiscard]] Result<int> getAvailable() const noexcept;
    [[nodiscard]] Result<int> getQueued() const noexcept;

    // everything put in so far becomes available, including what's buffered for resampling
    Result<void> flush() const noexcept;
    Result<void> clear() const noexcept;

    struct Formats {
        AudioSpec src;
        AudioSpec dst;
    };
    [[nodiscard]] Result<Formats> getFormat() const noexcept;
    // nothing = leave that side alone
    Result<void> setFormat(const std::optional<AudioSpec> &src, const std::optional<AudioSpec> &dst) const noexcept;

    // the device this is bound to, if any
    [[nodiscard]] std::optional<Device> getDevice() const noexcept;
    Result<void> resumeDevice() const noexcept;
    Result<void> pauseDevice() const noexcept;

   private:
    explicit Stream(SDL_AudioStream *stream) noexcept : m_stream(stream) {}

    UniquePtr<SDL_AudioStream, SDL_DestroyAudioStream> m_stream;
};

[[nodiscard]] int getNumDrivers() noexcept;
[[nodiscard]] std::optional<std::string_view> getDriver(int index) noexcept;
// std::nullopt before the audio subsystem is up
[[nodiscard]] std::optional<std::string_view> getCurrentDriver() noexcept;

[[nodiscard]] std::string_view getFormatName(std::optional<AudioFormat> format) noexcept;

}  // namespace sdl3bind::audio

#endif
