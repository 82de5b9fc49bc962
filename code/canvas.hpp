#ifndef MINILOGO_CANVAS_HPP
#define MINILOGO_CANVAS_HPP

#include <cstdint>
#include "error.hpp"
#include "string.hpp"
#include "containers.hpp"

namespace minilogo {
	struct Color {
		std::uint8_t r,g,b;
	};

	struct Canvas_Line {
		std::int32_t x0,y0;
		std::int32_t x1,y1;
		Color color;
	};

	//Every line is kept for the SVG output and also rasterized for the PNG one.
	struct Canvas {
		std::int32_t width,height;
		Heap_Array<Color> pixels;
		Heap_Array<Canvas_Line> lines;

		bool init(std::int32_t w,std::int32_t h,Error* error);
		void destroy();
		bool draw_line(std::int32_t x0,std::int32_t y0,std::int32_t x1,std::int32_t y1,Color color,Error* error);
		bool save_as_svg(String_View file_path,Error* error) const;
		bool save_as_png(String_View file_path,Error* error) const;
		//Picks the format from the file extension, "svg" or "png" in any case.
		bool save_image(String_View file_path,Error* error) const;
	};
}

#endif
