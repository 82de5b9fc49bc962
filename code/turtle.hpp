#ifndef MINILOGO_TURTLE_HPP
#define MINILOGO_TURTLE_HPP

#include <cstdint>
#include "error.hpp"
#include "canvas.hpp"
#include "string.hpp"

namespace minilogo {
	static constexpr std::int32_t Pen_Color_Count = 16;
	[[nodiscard]] Color get_pen_color(std::int32_t index);

	//Heading 0 points up and grows clockwise. Headings are never normalized.
	struct Turtle {
		std::int32_t x,y;
		std::int32_t heading;
		bool is_pen_down;
		std::int32_t pen_color_index;
		Canvas canvas;

		bool init(std::int32_t width,std::int32_t height,Error* error);
		void destroy();
		void pen_up();
		void pen_down();
		//Negative distances are redirected to the opposite or adjacent direction.
		bool forward(std::int32_t distance,Error* error);
		bool back(std::int32_t distance,Error* error);
		bool left(std::int32_t distance,Error* error);
		bool right(std::int32_t distance,Error* error);
		bool set_pen_color(std::int32_t index,Error* error);
		bool turn(std::int32_t degrees,Error* error);
		void set_heading(std::int32_t degrees);
		void set_x(std::int32_t position);
		void set_y(std::int32_t position);
		bool save_image(String_View file_path,Error* error) const;
	private:
		bool move(std::int64_t direction,std::int32_t distance,Error* error);
	};
}

#endif
