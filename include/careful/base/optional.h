#pragma once

#include <careful/base/fwd/optional.h>

#include <careful/base/checks.h>
#include <careful/base/lineinfo.h>

#include <new>
#include <type_traits>
#include <utility>

namespace careful
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    // A minimal optional that exits the tool, rather than throwing, when an empty value is accessed.
    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference_v<T>, "Optional<T&> is not supported");

        constexpr Optional() noexcept : m_inactive(), m_is_present(false) { }

        constexpr Optional(NullOpt) noexcept : m_inactive(), m_is_present(false) { }

        template<class U = T,
                 std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<U>>, Optional> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<U>>, NullOpt>,
                                  int> = 0>
        Optional(U&& t) noexcept(std::is_nothrow_constructible_v<T, U&&>) : m_t(std::forward<U>(t)), m_is_present(true)
        {
        }

        Optional(const Optional& o) noexcept(std::is_nothrow_copy_constructible_v<T>)
            : m_inactive(), m_is_present(false)
        {
            if (o.m_is_present)
            {
                ::new (&m_t) T(o.m_t);
                m_is_present = true;
            }
        }

        Optional(Optional&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : m_inactive(), m_is_present(false)
        {
            if (o.m_is_present)
            {
                ::new (&m_t) T(std::move(o.m_t));
                m_is_present = true;
            }
        }

        Optional& operator=(const Optional& o)
        {
            if (this != &o)
            {
                clear();
                if (o.m_is_present)
                {
                    ::new (&m_t) T(o.m_t);
                    m_is_present = true;
                }
            }

            return *this;
        }

        Optional& operator=(Optional&& o) noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            if (this != &o)
            {
                clear();
                if (o.m_is_present)
                {
                    ::new (&m_t) T(std::move(o.m_t));
                    m_is_present = true;
                }
            }

            return *this;
        }

        ~Optional() { clear(); }

        template<class... Args>
        T& emplace(Args&&... args)
        {
            clear();
            ::new (&m_t) T(std::forward<Args>(args)...);
            m_is_present = true;
            return m_t;
        }

        void clear() noexcept
        {
            if (m_is_present)
            {
                m_t.~T();
                m_is_present = false;
            }
        }

        constexpr bool has_value() const noexcept { return m_is_present; }
        constexpr explicit operator bool() const noexcept { return m_is_present; }

        T* get() noexcept { return m_is_present ? &m_t : nullptr; }
        const T* get() const noexcept { return m_is_present ? &m_t : nullptr; }

        T&& value_or_exit(const LineInfo& line_info) &&
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return std::move(m_t);
        }

        T& value_or_exit(const LineInfo& line_info) &
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        const T& value_or_exit(const LineInfo& line_info) const&
        {
            Checks::check_exit(line_info, m_is_present, "Value was null");
            return m_t;
        }

        template<class U>
        T value_or(U&& default_value) const&
        {
            return m_is_present ? m_t : static_cast<T>(std::forward<U>(default_value));
        }

        template<class U>
        T value_or(U&& default_value) &&
        {
            return m_is_present ? std::move(m_t) : static_cast<T>(std::forward<U>(default_value));
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs)
        {
            if (lhs.m_is_present && rhs.m_is_present)
            {
                return lhs.m_t == rhs.m_t;
            }

            return lhs.m_is_present == rhs.m_is_present;
        }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        union
        {
            char m_inactive;
            T m_t;
        };

        bool m_is_present;
    };

    template<class T>
    bool operator==(const Optional<T>& lhs, const T& rhs)
    {
        return lhs.has_value() && *lhs.get() == rhs;
    }
    template<class T>
    bool operator!=(const Optional<T>& lhs, const T& rhs)
    {
        return !(lhs == rhs);
    }
}
