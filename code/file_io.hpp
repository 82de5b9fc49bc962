#ifndef MINILOGO_FILE_IO_HPP
#define MINILOGO_FILE_IO_HPP

#include "utils.hpp"
#include "error.hpp"
#include "string.hpp"
#include "containers.hpp"

namespace minilogo {
	//The returned bytes are owned by the caller.
	[[nodiscard]] Option<Heap_Array<char>> read_file(String_View path,Error* error);
}

#endif
