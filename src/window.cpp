#include "window.hpp"

#include <stdexcept>

#include "utils.hpp"

Window::Window(std::size_t width, std::size_t height, const std::string& title)
    : width_(width), height_(height), pixel_buffer_(width * height) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        throw std::runtime_error(std::string("Could not initialise SDL: ") + SDL_GetError());
    }

    int anywhere = SDL_WINDOWPOS_UNDEFINED;
    window_ = SDL_CreateWindow(
        title.c_str(), anywhere, anywhere, static_cast<int>(width_), static_cast<int>(height_), 0
    );
    if (!window_) {
        std::string error = SDL_GetError();
        SDL_Quit();
        throw std::runtime_error("Could not set video mode: " + error);
    }

    // Renderer bound to window (software for portability)
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
    if (!renderer_) {
        std::string error = SDL_GetError();
        SDL_DestroyWindow(window_);
        SDL_Quit();
        throw std::runtime_error("Could not create renderer: " + error);
    }

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "linear");
    SDL_RenderSetLogicalSize(renderer_, static_cast<int>(width_), static_cast<int>(height_));

    // Backbuffer texture receiving ARGB pixels
    texture_ = SDL_CreateTexture(
        renderer_,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STATIC,
        static_cast<int>(width_),
        static_cast<int>(height_)
    );
    if (!texture_) {
        std::string error = SDL_GetError();
        SDL_DestroyRenderer(renderer_);
        SDL_DestroyWindow(window_);
        SDL_Quit();
        throw std::runtime_error("Could not allocate texture: " + error);
    }
}

Window::~Window() {
    if (texture_) SDL_DestroyTexture(texture_);
    if (renderer_) SDL_DestroyRenderer(renderer_);
    if (window_) SDL_DestroyWindow(window_);
    SDL_Quit();
}

void Window::register_key(
    const std::unordered_set<SDL_Scancode>& keys, Trigger trigger, KeyHandler handler
) {
    key_bindings_.push_back(KeyBinding{
        .keys = keys,
        .trigger = trigger,
        .handler = std::move(handler),
        .last_time = std::chrono::steady_clock::now()
    });
}

void Window::register_mouse(Uint8 button, MouseHandler handler) {
    mouse_bindings_.push_back(MouseBinding{.button = button, .handler = std::move(handler)});
}

bool Window::process_events() noexcept {
    // Reset per-frame input state, then drain SDL event queue
    SDL_Event event;
    keys_pressed_this_frame_.clear();
    mouse_xrel_ = 0;
    mouse_yrel_ = 0;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT ||
            (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE) ||
            (event.type == SDL_KEYDOWN && event.key.keysym.sym == SDLK_ESCAPE)) {
            return false;
        }

        if (event.type == SDL_KEYDOWN && !event.key.repeat) {
            SDL_Scancode sc = event.key.keysym.scancode;
            keys_this_frame_[sc] = true;
            keys_pressed_this_frame_.insert(sc);
        } else if (event.type == SDL_KEYUP) {
            keys_this_frame_[event.key.keysym.scancode] = false;
        } else if (event.type == SDL_MOUSEBUTTONDOWN) {
            mouse_buttons_down_.insert(event.button.button);
        } else if (event.type == SDL_MOUSEBUTTONUP) {
            mouse_buttons_down_.erase(event.button.button);
        } else if (event.type == SDL_MOUSEMOTION) {
            mouse_xrel_ += event.motion.xrel;
            mouse_yrel_ += event.motion.yrel;
        }
    }

    // Dispatch registered input handlers
    auto now = std::chrono::steady_clock::now();
    for (auto& binding : key_bindings_) {
        if (check_key_trigger(binding)) {
            float dt = std::chrono::duration<float>(now - binding.last_time).count();
            binding.handler(keys_this_frame_, dt);
        }
        binding.last_time = now;
    }
    if (mouse_xrel_ != 0 || mouse_yrel_ != 0) {
        for (auto& binding : mouse_bindings_) {
            if (mouse_buttons_down_.count(binding.button)) {
                binding.handler(mouse_xrel_, mouse_yrel_);
            }
        }
    }
    return true;
}

bool Window::has_modifier_keys() const noexcept {
    return keys_this_frame_[SDL_SCANCODE_LCTRL] || keys_this_frame_[SDL_SCANCODE_RCTRL] ||
           keys_this_frame_[SDL_SCANCODE_LSHIFT] || keys_this_frame_[SDL_SCANCODE_RSHIFT] ||
           keys_this_frame_[SDL_SCANCODE_LALT] || keys_this_frame_[SDL_SCANCODE_RALT];
}

bool Window::check_key_trigger(const KeyBinding& binding) const noexcept {
    if (binding.keys.empty()) return false;

    switch (binding.trigger) {
    case Trigger::ANY_PRESSED: {
        if (has_modifier_keys()) return false;
        for (auto key : binding.keys) {
            if (keys_this_frame_[key]) return true;
        }
        return false;
    }

    case Trigger::ANY_JUST_PRESSED: {
        if (has_modifier_keys()) return false;
        for (auto key : binding.keys) {
            if (keys_pressed_this_frame_.count(key)) return true;
        }
        return false;
    }

    case Trigger::ALL_JUST_PRESSED: {
        bool exists_pressed_this_frame = false;
        for (auto key : binding.keys) {
            if (!keys_this_frame_[key]) return false;
            if (keys_pressed_this_frame_.count(key)) exists_pressed_this_frame = true;
        }
        return exists_pressed_this_frame;
    }
    }

    return false;
}

void Window::update() noexcept {
    SDL_UpdateTexture(
        texture_,
        nullptr,
        pixel_buffer_.data(),
        static_cast<int>(width_ * sizeof(std::uint32_t))
    );
    SDL_RenderClear(renderer_);
    SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
    SDL_RenderPresent(renderer_);
}

std::uint32_t& Window::operator[](std::pair<std::size_t, std::size_t> xy) noexcept {
    return pixel_buffer_[xy.second * width_ + xy.first];
}

void Window::save_ppm(const std::string& filename) const {
    WritePPM(filename, width_, height_, pixel_buffer_);
}

void Window::save_bmp(const std::string& filename) const {
    SDL_Surface* surface = SDL_CreateRGBSurfaceFrom(
        const_cast<std::uint32_t*>(pixel_buffer_.data()),
        static_cast<int>(width_),
        static_cast<int>(height_),
        32,
        static_cast<int>(width_ * sizeof(std::uint32_t)),
        0xFF << 16,
        0xFF << 8,
        0xFF << 0,
        0xFFu << 24
    );
    if (!surface) {
        throw std::runtime_error(std::string("Could not create BMP surface: ") + SDL_GetError());
    }
    int result = SDL_SaveBMP(surface, filename.c_str());
    SDL_FreeSurface(surface);
    if (result != 0) {
        throw std::runtime_error("Could not save BMP: " + filename);
    }
}
