#pragma once

#include "dess/Config.hpp"
#include "dess/Exception.hpp"
#include "dess/Log.hpp"

#include <cassert>
#include <cstdlib>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace dess {
	struct ResultErrorTag {
		explicit ResultErrorTag() = default;
	};

	inline constexpr ResultErrorTag expected_error{};

	struct ResultValueTag {
		explicit ResultValueTag() = default;
	};

	inline constexpr ResultValueTag expected_value{};

	template<typename T, typename E>
	class Result;

	namespace detail {
		/// @brief Owns the error of a failed Result.
		/// An error that was never inspected is raised when its owner is destroyed.
		template<typename E>
		struct PendingError {
			std::unique_ptr<E> error;
			mutable bool inspected = false;

			PendingError() = default;
			PendingError(PendingError&&) = default;
			PendingError& operator=(PendingError&&) = delete;

			template<typename F>
			PendingError(PendingError<F>&& other) : error(other.error.release()), inspected(other.inspected) {
				static_assert(std::is_convertible_v<F*, E*>, "error must be convertible");
			}

			~PendingError() noexcept(false) {
				if (!error || inspected) {
					return;
				}
				std::unique_ptr<E> unhandled = std::move(error);
#if DESS_USE_EXCEPTIONS
				unhandled->throw_this();
#else
				log_error("unhandled error: {}", unhandled->what());
				std::abort();
#endif
			}
		};
	} // namespace detail

	/// @brief Either a value or a polymorphic error derived from E. Result<void, E> carries no value.
	/// Looking at the error through error() marks it handled; otherwise it is thrown (or aborts) on destruction.
	template<typename T, typename E = Exception>
	class Result {
		using stored_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

	public:
		using value_type = T;
		using error_type = E;

		template<typename... Args>
		Result(ResultValueTag, Args&&... args) : stored(std::in_place, std::forward<Args>(args)...) {}

		template<typename U>
		Result(ResultErrorTag, U&& err) {
			using V = std::remove_cvref_t<U>;
			static_assert(std::is_base_of_v<E, V>, "concrete error must derive from E");
#if DESS_FAIL_FAST
			log_error("{}", err.what());
			assert(0);
#endif
			failure.error = std::make_unique<V>(std::forward<U>(err));
		}

		/// @brief Forward the outcome of another Result. Only an error may change the value type.
		template<typename U, typename F>
		Result(Result<U, F>&& other) : failure(std::move(other.failure)) {
			if constexpr (std::is_same_v<U, T>) {
				if (other.stored) {
					stored.emplace(std::move(*other.stored));
				}
			} else {
				assert(!other.holds_value() && "only a failed Result can change its value type");
			}
		}

		Result(const Result&) = delete;
		Result& operator=(const Result&) = delete;

		[[nodiscard]] explicit operator bool() const {
			return stored.has_value();
		}

		[[nodiscard]] bool holds_value() const {
			return stored.has_value();
		}

		[[nodiscard]] stored_type* operator->() requires(!std::is_void_v<T>) {
			assert(holds_value() && "operator-> on a Result without a value");
			return &*stored;
		}

		[[nodiscard]] stored_type& operator*() & requires(!std::is_void_v<T>) {
			assert(holds_value() && "operator* on a Result without a value");
			return *stored;
		}

		[[nodiscard]] const stored_type& operator*() const& requires(!std::is_void_v<T>) {
			assert(holds_value() && "operator* on a Result without a value");
			return *stored;
		}

		[[nodiscard]] E& error() {
			assert(!holds_value() && "error() on a Result without an error");
			failure.inspected = true;
			return *failure.error;
		}

		[[nodiscard]] const E& error() const {
			assert(!holds_value() && "error() on a Result without an error");
			failure.inspected = true;
			return *failure.error;
		}

	private:
		std::optional<stored_type> stored;
		detail::PendingError<E> failure;

		template<typename U, typename F>
		friend class Result;
	};
} // namespace dess

/// @cond INTERNAL
#define DESS_DO_OR_RETURN(what)                                                                                                                                \
	if (auto res = what; !res) {                                                                                                                                 \
		return std::move(res);                                                                                                                                     \
	}
/// @endcond
