#pragma once

#include <utility>

/**
 * @brief 持有一个需要手动释放的句柄（文件描述符等），离开作用域时自动释放
 * Traits 需要提供 value_type、invalid_value() 和 free(value_type &)
 */
template <typename Traits>
class scoped_generic : public Traits {
public:
    using element_type = typename Traits::value_type;
    using traits_type = Traits;

    scoped_generic() : data(traits_type::invalid_value()) {}
    explicit scoped_generic(const element_type &value) : data(value) {}
    scoped_generic(scoped_generic<Traits> &&value) noexcept : data(value.release()) {}
    scoped_generic(const scoped_generic &) = delete;
    scoped_generic &operator=(const scoped_generic &) = delete;

    ~scoped_generic() {
        free_if_necessary();
    }

    scoped_generic &operator=(scoped_generic<Traits> &&value) noexcept {
        reset(value.release());
        return *this;
    }

    void reset(const element_type &value = traits_type::invalid_value()) {
        if (data == value) return;
        free_if_necessary();
        data = value;
    }

    void swap(scoped_generic &other) noexcept {
        if (&other == this) return;

        using std::swap;
        swap(data, other.data);
    }

    [[nodiscard]] element_type release() {
        element_type old_data = std::move(data);
        data = traits_type::invalid_value();
        return old_data;
    }

    const element_type &get() const { return data; }
    bool is_valid() const { return data != traits_type::invalid_value(); }

private:
    void free_if_necessary() {
        if (data != traits_type::invalid_value()) {
            traits_type::free(data);
            data = traits_type::invalid_value();
        }
    }

    element_type data;
};

template <typename Traits>
void swap(scoped_generic<Traits> &a, scoped_generic<Traits> &b) noexcept {
    a.swap(b);
}
