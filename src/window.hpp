#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "SDL.h"

/**
 * @brief SDL-backed window, input, and pixel backbuffer manager.
 */
class Window {
public:
    // Event trigger types
    enum class Trigger {
        ANY_PRESSED,       // Held keys, repeated every frame; blocked when modifiers pressed
        ANY_JUST_PRESSED,  // First frame of a press; blocked when modifiers pressed
        ALL_JUST_PRESSED   // Modifier combo: triggers on just-pressed when ALL keys held
    };

    using KeyState = std::array<bool, SDL_NUM_SCANCODES>;
    using KeyHandler = std::function<void(const KeyState&, float)>;
    using MouseHandler = std::function<void(int, int)>;

private:
    struct KeyBinding {
        std::unordered_set<SDL_Scancode> keys;
        Trigger trigger;
        KeyHandler handler;
        std::chrono::steady_clock::time_point last_time;
    };

    struct MouseBinding {
        Uint8 button;
        MouseHandler handler;
    };

public:
    // Window properties
    const std::size_t width_;
    const std::size_t height_;

private:
    // SDL components
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;

    // Backbuffer
    std::vector<std::uint32_t> pixel_buffer_;

    // Input management
    KeyState keys_this_frame_{};
    std::unordered_set<SDL_Scancode> keys_pressed_this_frame_;
    std::unordered_set<Uint8> mouse_buttons_down_;
    int mouse_xrel_ = 0;
    int mouse_yrel_ = 0;

    std::vector<KeyBinding> key_bindings_;
    std::vector<MouseBinding> mouse_bindings_;

public:
    /**
     * @brief Opens the window.
     * @throws std::runtime_error if SDL cannot create the window, renderer or texture.
     */
    Window(std::size_t width, std::size_t height, const std::string& title);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

public:
    [[nodiscard]] std::uint32_t& operator[](std::pair<std::size_t, std::size_t> xy) noexcept;
    [[nodiscard]] const std::vector<std::uint32_t>& get_pixel_buffer() const noexcept {
        return pixel_buffer_;
    }

public:
    /**
     * @brief Registers a key binding with a trigger policy.
     * @param keys Set of scancodes to monitor.
     * @param trigger Trigger mode.
     * @param handler Callback receiving key state and seconds since its last call.
     */
    void register_key(
        const std::unordered_set<SDL_Scancode>& keys, Trigger trigger, KeyHandler handler
    );

    /**
     * @brief Registers a drag handler for a mouse button.
     * @param button SDL mouse button.
     * @param handler Callback receiving relative motion while the button is held.
     */
    void register_mouse(Uint8 button, MouseHandler handler);

    /// @brief Polls SDL events and dispatches registered handlers. Returns false on quit.
    bool process_events() noexcept;
    /// @brief Uploads backbuffer to SDL texture and presents it.
    void update() noexcept;

    void save_ppm(const std::string& filename) const;
    void save_bmp(const std::string& filename) const;

private:
    bool has_modifier_keys() const noexcept;
    bool check_key_trigger(const KeyBinding& binding) const noexcept;
};
