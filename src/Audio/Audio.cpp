// Copyright (c) 2026, WH, All rights reserved.
#include "Audio.h"

#include <SDL3/SDL_stdinc.h>

namespace sdl3bind::audio {
namespace {  // static

Result<std::vector<Device>> devicesFrom(SDL_AudioDeviceID *ids, int count) {
    auto checked = errors::wrapCallPtr(ids);
    if(!checked) return std::unexpected(checked.error());

    std::vector<Device> ret;
    ret.reserve(count);
    for(int i = 0; i < count; i++) {
        ret.emplace_back((*checked)[i]);
    }
    SDL_free(*checked);
    return ret;
}

std::optional<std::string_view> optionalString(const char *str) noexcept {
    if(str == nullptr) return std::nullopt;
    return std::string_view{str};
}

}  // namespace

Result<std::vector<Device>> Device::getPlaybackDevices() {
    int count = 0;
    SDL_AudioDeviceID *ids = SDL_GetAudioPlaybackDevices(&count);
    return devicesFrom(ids, count);
}

Result<std::vector<Device>> Device::getRecordingDevices() {
    int count = 0;
    SDL_AudioDeviceID *ids = SDL_GetAudioRecordingDevices(&count);
    return devicesFrom(ids, count);
}

Result<std::string_view> Device::getName() const noexcept {
    return errors::wrapCallCString(SDL_GetAudioDeviceName(m_id));
}

Result<Device::Format> Device::getFormat() const noexcept {
    SDL_AudioSpec spec{};
    int frames = 0;
    if(auto ok = errors::wrapCallBool(SDL_GetAudioDeviceFormat(m_id, &spec, &frames)); !ok)
        return std::unexpected(ok.error());
    return Format{.spec = fromNative(spec), .sample_frames = frames};
}

Result<OpenedDevice> Device::open(const std::optional<AudioSpec> &spec) const noexcept {
    SDL_AudioSpec native{};
    if(spec) native = toNative(*spec);
    auto id = errors::wrapCall<SDL_AudioDeviceID>(SDL_OpenAudioDevice(m_id, spec ? &native : nullptr), 0);
    if(!id) return std::unexpected(id.error());
    return OpenedDevice{*id};
}

Result<void> OpenedDevice::pause() const noexcept { return errors::wrapCallBool(SDL_PauseAudioDevice(id())); }

Result<void> OpenedDevice::resume() const noexcept { return errors::wrapCallBool(SDL_ResumeAudioDevice(id())); }

bool OpenedDevice::paused() const noexcept { return SDL_AudioDevicePaused(id()); }

Result<float> OpenedDevice::getGain() const noexcept { return errors::wrapCall(SDL_GetAudioDeviceGain(id()), -1.f); }

Result<void> OpenedDevice::setGain(float gain) const noexcept {
    return errors::wrapCallBool(SDL_SetAudioDeviceGain(id(), gain));
}

Result<void> OpenedDevice::bindStream(const Stream &stream) const noexcept {
    return errors::wrapCallBool(SDL_BindAudioStream(id(), stream.get()));
}

Result<Stream> Stream::create(const AudioSpec &src, const AudioSpec &dst) noexcept {
    const SDL_AudioSpec nsrc = toNative(src), ndst = toNative(dst);
    auto stream = errors::wrapCallPtr(SDL_CreateAudioStream(&nsrc, &ndst));
    if(!stream) return std::unexpected(stream.error());
    return Stream{*stream};
}

Result<Stream> Stream::openDeviceStream(Device device, const std::optional<AudioSpec> &spec) noexcept {
    SDL_AudioSpec native{};
    if(spec) native = toNative(*spec);
    auto stream =
        errors::wrapCallPtr(SDL_OpenAudioDeviceStream(device.id(), spec ? &native : nullptr, nullptr, nullptr));
    if(!stream) return std::unexpected(stream.error());
    return Stream{*stream};
}

Result<void> Stream::putData(std::span<const std::byte> data) const noexcept {
    return errors::wrapCallBool(SDL_PutAudioStreamData(get(), data.data(), static_cast<int>(data.size())));
}

Result<int> Stream::getData(std::span<std::byte> out) const noexcept {
    return errors::wrapCall(SDL_GetAudioStreamData(get(), out.data(), static_cast<int>(out.size())), -1);
}

Result<int> Stream::getAvailable() const noexcept { return errors::wrapCall(SDL_GetAudioStreamAvailable(get()), -1); }

Result<int> Stream::getQueued() const noexcept { return errors::wrapCall(SDL_GetAudioStreamQueued(get()), -1); }

Result<void> Stream::flush() const noexcept { return errors::wrapCallBool(SDL_FlushAudioStream(get())); }

Result<void> Stream::clear() const noexcept { return errors::wrapCallBool(SDL_ClearAudioStream(get())); }

Result<Stream::Formats> Stream::getFormat() const noexcept {
    SDL_AudioSpec src{}, dst{};
    if(auto ok = errors::wrapCallBool(SDL_GetAudioStreamFormat(get(), &src, &dst)); !ok)
        return std::unexpected(ok.error());
    return Formats{.src = fromNative(src), .dst = fromNative(dst)};
}

Result<void> Stream::setFormat(const std::optional<AudioSpec> &src,
                               const std::optional<AudioSpec> &dst) const noexcept {
    SDL_AudioSpec nsrc{}, ndst{};
    if(src) nsrc = toNative(*src);
    if(dst) ndst = toNative(*dst);
    return errors::wrapCallBool(SDL_SetAudioStreamFormat(get(), src ? &nsrc : nullptr, dst ? &ndst : nullptr));
}

std::optional<Device> Stream::getDevice() const noexcept {
    const SDL_AudioDeviceID id = SDL_GetAudioStreamDevice(get());
    if(id == 0) return std::nullopt;
    return Device{id};
}

Result<void> Stream::resumeDevice() const noexcept { return errors::wrapCallBool(SDL_ResumeAudioStreamDevice(get())); }

Result<void> Stream::pauseDevice() const noexcept { return errors::wrapCallBool(SDL_PauseAudioStreamDevice(get())); }

int getNumDrivers() noexcept { return SDL_GetNumAudioDrivers(); }

std::optional<std::string_view> getDriver(int index) noexcept { return optionalString(SDL_GetAudioDriver(index)); }

std::optional<std::string_view> getCurrentDriver() noexcept { return optionalString(SDL_GetCurrentAudioDriver()); }

std::string_view getFormatName(std::optional<AudioFormat> format) noexcept {
    return SDL_GetAudioFormatName(toNative(format));
}

}  // namespace sdl3bind::audio
