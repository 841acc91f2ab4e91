// Copyright (c) 2011, PG & 2025, WH & 2025, kiwec, All rights reserved.
#ifndef CONVAR_H
#define CONVAR_H

#include "BaseEnvironment.h"

#include "fmt/format.h"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

using std::string_view_literals::operator""sv;

#ifndef DEFINE_CONVARS
#include "ConVarDefs.h"
#endif

namespace cv {
enum CvarFlags : uint8_t {
    // Modifiable from the command line/config files
    CLIENT = (1 << 0),

    // Hidden from listings (e.g. deprecated cvars)
    HIDDEN = (1 << 1),

    // Don't load this cvar from configs
    NOLOAD = (1 << 2),

};
}

class ConVar {
#ifndef DEFINE_CONVARS
    friend class ConVarHandler;
#endif

   public:
    enum class CONVAR_TYPE : uint8_t { BOOL, INT, FLOAT, STRING };

    using VoidCB = std::function<void()>;
    using StringCB = std::function<void(std::string_view)>;
    using FloatCB = std::function<void(float)>;
    using StringChangeCB = std::function<void(std::string_view, std::string_view)>;
    using FloatChangeCB = std::function<void(float, float)>;

    // 1 "new value" callback and 1 "old value -> new value" callback at most
    using ExecCallback = std::variant<std::monostate, VoidCB, StringCB, FloatCB>;
    using ChangeCallback = std::variant<std::monostate, StringChangeCB, FloatChangeCB>;

    template <typename... Args>
    static inline constexpr bool cb_invocable = std::is_invocable_v<Args...>;

    template <typename Callback>
    static inline constexpr bool any_cb_invocable =
        cb_invocable<Callback> || cb_invocable<Callback, std::string_view> || cb_invocable<Callback, float> ||
        cb_invocable<Callback, std::string_view, std::string_view> || cb_invocable<Callback, float, float>;

   private:
    template <typename T>
    static constexpr CONVAR_TYPE getTypeFor() {
        if constexpr(std::is_same_v<std::decay_t<T>, bool>)
            return CONVAR_TYPE::BOOL;
        else if constexpr(std::is_integral_v<std::decay_t<T>>)
            return CONVAR_TYPE::INT;
        else if constexpr(std::is_floating_point_v<std::decay_t<T>>)
            return CONVAR_TYPE::FLOAT;
        else
            return CONVAR_TYPE::STRING;
    }

    template <typename T>
    static inline constexpr bool is_numeric_v =
        std::is_arithmetic_v<std::decay_t<T>> && !std::is_same_v<std::decay_t<T>, char>;

    void addConVar();

   public:
    template <typename T>
    explicit ConVar(const char *name, T defaultValue, uint8_t flags, const char *helpString = "")
        requires(is_numeric_v<T>)
        : sName(name), sHelpString(helpString) {
        this->initValue(defaultValue, flags, nullptr);
        this->addConVar();
    }

    template <typename T, typename Callback>
    explicit ConVar(const char *name, T defaultValue, uint8_t flags, const char *helpString, Callback callback)
        requires(is_numeric_v<T> && any_cb_invocable<Callback>)
        : sName(name), sHelpString(helpString) {
        this->initValue(defaultValue, flags, callback);
        this->addConVar();
    }

    explicit ConVar(const char *name, std::string_view defaultValue, uint8_t flags, const char *helpString = "")
        : sName(name), sHelpString(helpString) {
        this->initValue(defaultValue, flags, nullptr);
        this->addConVar();
    }

    template <typename Callback>
    explicit ConVar(const char *name, std::string_view defaultValue, uint8_t flags, const char *helpString,
                    Callback callback)
        requires(any_cb_invocable<Callback>)
        : sName(name), sHelpString(helpString) {
        this->initValue(defaultValue, flags, callback);
        this->addConVar();
    }

    // value "editor" checks: only CLIENT convars can be changed from outside
    template <typename T>
    void setValue(T &&value, bool doCallback = true) {
        if(!this->isFlagSet(cv::CLIENT)) return;
        this->setValueInt(std::forward<T>(value), doCallback);
    }

    template <typename Callback>
    void setCallback(Callback &&callback)
        requires(any_cb_invocable<Callback>)
    {
        this->storeCallback(std::forward<Callback>(callback));
    }

    inline void removeCallback() { this->callback = std::monostate(); }
    inline void removeChangeCallback() { this->changeCallback = std::monostate(); }
    inline void removeAllCallbacks() {
        this->removeCallback();
        this->removeChangeCallback();
    }

    // back to the default value (runs callbacks)
    void reset();

    [[nodiscard]] inline const std::string &getDefaultString() const { return this->sDefaultValue; }


    [[nodiscard]] inline double getDouble() const { return this->dValue.load(std::memory_order_acquire); }
    [[nodiscard]] inline const std::string &getString() const { return this->sValue; }

    [[nodiscard]] inline int getInt() const { return static_cast<int>(this->getDouble()); }
    [[nodiscard]] inline bool getBool() const { return this->getDouble() != 0.; }
    [[nodiscard]] inline float getFloat() const { return static_cast<float>(this->getDouble()); }

    [[nodiscard]] inline const char *getHelpstring() const { return this->sHelpString; }
    [[nodiscard]] inline const char *getName() const { return this->sName; }
    [[nodiscard]] inline CONVAR_TYPE getType() const { return this->type; }
    [[nodiscard]] inline uint8_t getFlags() const { return this->iFlags; }

    [[nodiscard]] inline bool isFlagSet(uint8_t flag) const { return ((this->iFlags & flag) == flag); }
    [[nodiscard]] inline bool isDefault() const { return this->getString() == this->getDefaultString(); }

   private:
    template <typename Callback>
    void storeCallback(Callback &&cb) {
        if constexpr(cb_invocable<Callback>)
            this->callback = VoidCB(std::forward<Callback>(cb));
        else if constexpr(cb_invocable<Callback, std::string_view>)
            this->callback = StringCB(std::forward<Callback>(cb));
        else if constexpr(cb_invocable<Callback, float>)
            this->callback = FloatCB(std::forward<Callback>(cb));
        else if constexpr(cb_invocable<Callback, std::string_view, std::string_view>)
            this->changeCallback = StringChangeCB(std::forward<Callback>(cb));
        else if constexpr(cb_invocable<Callback, float, float>)
            this->changeCallback = FloatChangeCB(std::forward<Callback>(cb));
    }

    template <typename T, typename Callback>
    void initValue(const T &defaultValue, uint8_t flags, Callback cb) {
        this->iFlags = flags;
        this->type = getTypeFor<T>();

        if constexpr(is_numeric_v<T>) {
            this->setDefaultDouble(static_cast<double>(defaultValue));
        } else {
            this->setDefaultString(defaultValue);
        }

        this->sValue = this->sDefaultValue;
        this->dValue.store(this->dDefaultValue, std::memory_order_relaxed);

        if constexpr(!std::is_same_v<Callback, std::nullptr_t>) {
            this->storeCallback(cb);
        }
    }

    void setDefaultDouble(double defaultValue);
    void setDefaultString(std::string_view defaultValue);

    // parse "true"/"false" for bools, numbers for everything numeric
    [[nodiscard]] double parseDouble(std::string_view str) const;

    // no flag checking, setValue (user-accessible) already does that
    template <typename T>
    void setValueInt(T &&value, bool doCallback) {
        const auto [newDouble, newString] = [&]() -> std::pair<double, std::string> {
            if constexpr(std::is_same_v<std::decay_t<T>, bool>) {
                return std::make_pair(value ? 1. : 0., value ? "true" : "false");
            } else if constexpr(is_numeric_v<T>) {
                const auto f = static_cast<double>(value);
                if(this->type == CONVAR_TYPE::BOOL) return std::make_pair(f != 0. ? 1. : 0., f != 0. ? "true" : "false");
                return std::make_pair(f, fmt::format("{:g}", f));
            } else {
                std::string s{std::forward<T>(value)};
                const double f = this->parseDouble(s);
                if(this->type == CONVAR_TYPE::BOOL) return std::make_pair(f, f != 0. ? "true" : "false");
                return std::make_pair(f, std::move(s));
            }
        }();

        // backup old values, for passing into callbacks
        const double oldDouble{this->getDouble()};
        std::string oldString;
        if(doCallback) {
            oldString = this->getString();
        }

        this->dValue.store(newDouble, std::memory_order_release);
        this->sValue = newString;

        if(!doCallback) return;

        std::visit(
            [&](auto &&cb) {
                using CBType = std::decay_t<decltype(cb)>;
                if constexpr(std::is_same_v<CBType, VoidCB>)
                    cb();
                else if constexpr(std::is_same_v<CBType, StringCB>)
                    cb(newString);
                else if constexpr(std::is_same_v<CBType, FloatCB>)
                    cb(static_cast<float>(newDouble));
            },
            this->callback);

        std::visit(
            [&](auto &&cb) {
                using CBType = std::decay_t<decltype(cb)>;
                if constexpr(std::is_same_v<CBType, StringChangeCB>)
                    cb(oldString, newString);
                else if constexpr(std::is_same_v<CBType, FloatChangeCB>)
                    cb(static_cast<float>(oldDouble), static_cast<float>(newDouble));
            },
            this->changeCallback);
    }

   private:
    const char *sName;
    const char *sHelpString;
    std::string sDefaultValue{};
    double dDefaultValue{0.0};

    std::atomic<double> dValue{0.0};
    std::string sValue{};

    ExecCallback callback{std::monostate()};
    ChangeCallback changeCallback{std::monostate()};

    CONVAR_TYPE type{CONVAR_TYPE::FLOAT};
    uint8_t iFlags{0};
};

#endif
