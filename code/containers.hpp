#ifndef MINILOGO_CONTAINERS_HPP
#define MINILOGO_CONTAINERS_HPP

#include <new>
#include <cstddef>
#include <cstring>
#include <type_traits>
#include "utils.hpp"

namespace minilogo {
	template<typename T>
	struct Array_View {
		const T* ptr;
		std::size_t length;
		Array_View() : ptr(),length() {}
		Array_View(const T* _ptr,std::size_t _length) : ptr(_ptr),length(_length) {}
		[[nodiscard]] const T* begin() const { return ptr; }
		[[nodiscard]] const T* end() const { return ptr + length; }
		[[nodiscard]] const T& operator[](std::size_t index) const { return ptr[index]; }
	};

	template<typename T,std::size_t Capacity>
	struct Static_Array {
		T data[Capacity];
		std::size_t length;
		Static_Array() : length() {}

		bool push_back(const T& value) {
			if(length >= Capacity) return false;
			data[length++] = value;
			return true;
		}

		[[nodiscard]] const T* begin() const { return &data[0]; }
		[[nodiscard]] const T* end() const { return &data[length]; }
		[[nodiscard]] const T& operator[](std::size_t index) const { return data[index]; }
	};

	//Owning growable array. Copies are shallow, the owner calls 'destroy'.
	template<typename T>
	struct Heap_Array {
		T* data;
		std::size_t capacity;
		std::size_t length;

		void destroy() {
			delete[] data;
			data = nullptr;
			capacity = 0;
			length = 0;
		}
		bool reserve(std::size_t new_capacity) {
			if(new_capacity <= capacity) return true;
			T* tmp = new(std::nothrow) T[new_capacity];
			if(!tmp) return false;
			if constexpr(std::is_trivially_copyable_v<T>) {
				if(length > 0) std::memcpy(static_cast<void*>(tmp),data,length * sizeof(T));
			}
			else for(auto i : Range(length)) { tmp[i] = data[i]; }
			delete[] data;
			data = tmp;
			capacity = new_capacity;
			return true;
		}
		bool resize(std::size_t new_length,const T& fill = {}) {
			if(!reserve(new_length)) return false;
			for(std::size_t i = length;i < new_length;i += 1) data[i] = fill;
			length = new_length;
			return true;
		}
		bool push_back(const T& value) {
			if((length + 1) > capacity) {
				std::size_t new_capacity = (capacity == 0) ? 4 : (capacity * 2);
				if(!reserve(new_capacity)) return false;
			}
			data[length] = value;
			length += 1;
			return true;
		}
		void pop_back() {
			if(length > 0) length -= 1;
		}

		[[nodiscard]] bool is_empty() const { return length == 0; }
		[[nodiscard]] Array_View<T> view() const { return {data,length}; }
		[[nodiscard]] T& back() { return data[length - 1]; }
		[[nodiscard]] T* begin() { return data; }
		[[nodiscard]] T* end() { return data + length; }
		[[nodiscard]] T& operator[](std::size_t index) { return data[index]; }
		[[nodiscard]] const T* begin() const { return data; }
		[[nodiscard]] const T* end() const { return data + length; }
		[[nodiscard]] const T& operator[](std::size_t index) const { return data[index]; }
	};
}

#endif
