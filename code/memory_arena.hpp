#ifndef MINILOGO_MEMORY_ARENA_HPP
#define MINILOGO_MEMORY_ARENA_HPP

#include <new>
#include "utils.hpp"
#include "string.hpp"
#include "containers.hpp"

namespace minilogo {
	//Bump allocator for AST nodes and strings. Everything is released at once by 'destroy'.
	struct Arena_Allocator {
		struct Arena {
			char* buffer;
			std::size_t capacity;
			std::size_t head_index;
		};

		std::size_t arena_size;
		Heap_Array<Arena> arenas;

		void destroy();
		template<typename T>
		[[nodiscard]] T* construct() {
			static_assert(std::is_trivially_destructible_v<T>);
			void* ptr = allocate_memory(sizeof(T),alignof(T));
			if(!ptr) return nullptr;
			return new(ptr) T{};
		}
		template<typename T>
		[[nodiscard]] T* construct_array(std::size_t count) {
			static_assert(std::is_trivially_destructible_v<T>);
			if(count == 0) count = 1;
			void* ptr = allocate_memory(sizeof(T) * count,alignof(T));
			if(!ptr) return nullptr;
			T* array = static_cast<T*>(ptr);
			for(auto i : Range(count)) new(array + i) T{};
			return array;
		}
		//Returned strings are null terminated.
		[[nodiscard]] char* construct_string(std::size_t length);
		[[nodiscard]] Option<String_View> copy_string(String_View string);
	private:
		bool create_new_arena(std::size_t minimum_capacity);
		[[nodiscard]] void* allocate_memory(std::size_t size,std::size_t alignment);
	};
}

#endif
