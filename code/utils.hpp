#ifndef MINILOGO_UTILS_HPP
#define MINILOGO_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>

namespace minilogo {
	static constexpr double PI = 3.141592653589793;
	[[nodiscard]] constexpr double radians(double value) {
		return value * PI / 180.0;
	}

	template<typename T>
	struct Range {
		struct Iterator {
			T value;
			bool operator==(Iterator it) const { return value == it.value; }
			Iterator& operator++() { value += 1; return *this; }
			const T& operator*() const { return value; }
		};
		T min;
		T max;
		Range(T _max) : min(),max(_max) {}
		Range(T _min,T _max) : min(_min),max(_max) {}
		Iterator begin() const { return {min}; }
		Iterator end() const { return {max}; }
	};
	template<typename T>
	Range(T) -> Range<T>;
	template<typename T,typename U>
	Range(T,U) -> Range<std::common_type_t<T,U>>;

	template<typename T>
	struct Option {
		T value;
		bool has_value;
		Option() : value(),has_value() {}
		Option(const Option<T>& option) : value(option.value),has_value(option.has_value) {}
		Option(const T& _value) : value(_value),has_value(true) {}
		Option& operator=(const T& _value) {
			value = _value;
			has_value = true;
			return *this;
		}
		Option& operator=(const Option<T>& option) {
			value = option.value;
			has_value = option.has_value;
			return *this;
		}
	};

	template<typename Lambda>
	struct Deferred_Lambda {
		Lambda lambda;
		Deferred_Lambda(Lambda&& _lambda) : lambda(std::move(_lambda)) {}
		~Deferred_Lambda() { lambda(); }
	};
#define MINILOGO_CONCAT_(X,Y) X##Y
#define MINILOGO_CONCAT(X,Y) MINILOGO_CONCAT_(X,Y)
#define defer minilogo::Deferred_Lambda MINILOGO_CONCAT(_lambda,__LINE__) =

	template<typename Type,typename... Types>
	[[nodiscard]] constexpr bool is_one_of(const Type& type,const Types&... types) {
		return ((type == types) || ...);
	}

	[[nodiscard]] constexpr std::size_t kilobytes(std::size_t count) {
		return count * 1024;
	}

	template<typename T,std::size_t Count>
	[[nodiscard]] constexpr std::size_t array_length(const T(&)[Count]) {
		return Count;
	}

	//Results outside of the int32 range are reported as not present.
	[[nodiscard]] inline Option<std::int32_t> narrow_to_int32(std::int64_t value) {
		if(value < INT32_MIN || value > INT32_MAX) return {};
		return static_cast<std::int32_t>(value);
	}
}

#endif
