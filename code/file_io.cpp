#include <climits>
#include "debug.hpp"
#include "file_io.hpp"
#if defined(_WIN32) || defined(_WIN64) || defined(WIN32)
	#define PLATFORM_WINDOWS
	#define WIN32_LEAN_AND_MEAN
	#define NOMINMAX
	#include <Windows.h>
	#undef near
	#undef far
#else
	#include <fcntl.h>
	#include <unistd.h>
	#include <sys/stat.h>
#endif

static_assert(CHAR_BIT == 8);

namespace minilogo {
	Option<Heap_Array<char>> read_file(String_View path,Error* error) {
		Array_String<1024> null_terminated_path{};
		if(!null_terminated_path.append(path)) {
			minilogo::report_error(error,Error_Type::IO_Error,"File path \"%\" is too long.",path);
			return {};
		}

#ifdef PLATFORM_WINDOWS
		HANDLE file = CreateFileA(null_terminated_path.buffer,GENERIC_READ,FILE_SHARE_READ,nullptr,OPEN_EXISTING,FILE_ATTRIBUTE_NORMAL,0);
		if(file == INVALID_HANDLE_VALUE) {
			minilogo::report_error(error,Error_Type::IO_Error,"File \"%\" couldn't be opened.",path);
			return {};
		}
		defer[&]{CloseHandle(file);};

		std::size_t file_size = 0;
		{
			LARGE_INTEGER raw_file_size{};
			if(!GetFileSizeEx(file,&raw_file_size)) {
				minilogo::report_error(error,Error_Type::IO_Error,"Couldn't obtain the size of file \"%\".",path);
				return {};
			}
			file_size = static_cast<std::size_t>(raw_file_size.QuadPart);
			if(file_size > MAXDWORD) {
				minilogo::report_error(error,Error_Type::IO_Error,"File \"%\" is too big (max % bytes).",path,static_cast<std::size_t>(MAXDWORD));
				return {};
			}
		}

		Heap_Array<char> bytes{};
		if(!bytes.resize(file_size)) {
			minilogo::report_out_of_memory(error,file_size);
			return {};
		}
		DWORD read_bytes{};
		if(!ReadFile(file,bytes.data,static_cast<DWORD>(file_size),&read_bytes,nullptr) || read_bytes != file_size) {
			bytes.destroy();
			minilogo::report_error(error,Error_Type::IO_Error,"Couldn't read data from file \"%\".",path);
			return {};
		}
		return bytes;
#else
		int file = open64(null_terminated_path.buffer,O_RDONLY);
		if(file == -1) {
			minilogo::report_error(error,Error_Type::IO_Error,"File \"%\" couldn't be opened.",path);
			return {};
		}
		defer[&]{close(file);};

		struct stat64 file_stat{};
		if(fstat64(file,&file_stat) == -1) {
			minilogo::report_error(error,Error_Type::IO_Error,"Couldn't obtain the size of file \"%\".",path);
			return {};
		}

		auto file_size = static_cast<std::size_t>(file_stat.st_size);
		Heap_Array<char> bytes{};
		if(!bytes.resize(file_size)) {
			minilogo::report_out_of_memory(error,file_size);
			return {};
		}
		std::size_t total_read = 0;
		while(total_read < file_size) {
			ssize_t count = read(file,bytes.data + total_read,file_size - total_read);
			if(count <= 0) {
				bytes.destroy();
				minilogo::report_error(error,Error_Type::IO_Error,"Couldn't read data from file \"%\".",path);
				return {};
			}
			total_read += static_cast<std::size_t>(count);
		}
		minilogo::trace("Read % bytes from \"%\".",file_size,path);
		return bytes;
#endif
	}
}
