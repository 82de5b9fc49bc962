#include <cstring>
#include "debug.hpp"
#include "memory_arena.hpp"

namespace minilogo {
	void Arena_Allocator::destroy() {
		for(auto& arena : arenas) delete[] arena.buffer;
		arenas.destroy();
	}

	bool Arena_Allocator::create_new_arena(std::size_t minimum_capacity) {
		Arena arena{};
		arena.capacity = (minimum_capacity > arena_size) ? minimum_capacity : arena_size;
		arena.buffer = new(std::nothrow) char[arena.capacity];
		if(!arena.buffer) return false;
		if(!arenas.push_back(arena)) {
			delete[] arena.buffer;
			return false;
		}
		return true;
	}

	char* Arena_Allocator::construct_string(std::size_t length) {
		auto* ptr = static_cast<char*>(allocate_memory(length + 1,alignof(char)));
		if(!ptr) return nullptr;
		std::memset(ptr,0,length + 1);
		return ptr;
	}

	Option<String_View> Arena_Allocator::copy_string(String_View string) {
		char* ptr = construct_string(string.byte_length());
		if(!ptr) return {};
		if(string.byte_length() > 0) std::memcpy(ptr,string.begin_ptr,string.byte_length());
		return String_View(ptr,string.byte_length());
	}

	void* Arena_Allocator::allocate_memory(std::size_t size,std::size_t alignment) {
		if(arena_size == 0) arena_size = minilogo::kilobytes(64);
		minilogo::assert(alignment >= 1 && (alignment & (alignment - 1)) == 0);

		auto aligned_head = [](const Arena& arena,std::size_t alignment) {
			return (arena.head_index + (alignment - 1)) & ~(alignment - 1);
		};
		if(arenas.length == 0 || aligned_head(arenas.back(),alignment) + size > arenas.back().capacity) {
			//'new char[]' memory is aligned for any fundamental type, so a fresh arena starts aligned.
			if(!create_new_arena(size)) return nullptr;
		}

		Arena& arena = arenas.back();
		std::size_t offset = aligned_head(arena,alignment);
		arena.head_index = offset + size;
		return arena.buffer + offset;
	}
}
