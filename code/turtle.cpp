#include <cmath>
#include "debug.hpp"
#include "turtle.hpp"

namespace minilogo {
	static constexpr Color Pen_Colors[Pen_Color_Count] = {
		{0,0,0},
		{0,0,255},
		{0,255,255},
		{0,255,0},
		{255,0,0},
		{255,0,255},
		{255,255,0},
		{255,255,255},
		{155,96,59},
		{197,136,18},
		{100,162,64},
		{120,187,187},
		{255,149,119},
		{144,113,208},
		{255,163,0},
		{183,183,183}
	};
	static constexpr std::int32_t Default_Pen_Color_Index = 7;

	Color get_pen_color(std::int32_t index) {
		minilogo::assert(index >= 0 && index < Pen_Color_Count);
		return Pen_Colors[index];
	}

	bool Turtle::init(std::int32_t width,std::int32_t height,Error* error) {
		x = width / 2;
		y = height / 2;
		heading = 0;
		is_pen_down = false;
		pen_color_index = Default_Pen_Color_Index;
		return canvas.init(width,height,error);
	}

	void Turtle::destroy() {
		canvas.destroy();
	}

	void Turtle::pen_up() {
		is_pen_down = false;
	}

	void Turtle::pen_down() {
		is_pen_down = true;
	}

	[[nodiscard]] static Option<std::int32_t> negate_distance(std::int32_t distance,Error* error) {
		auto [negated,success] = minilogo::narrow_to_int32(-static_cast<std::int64_t>(distance));
		if(!success) {
			minilogo::report_error(error,Error_Type::Overflow,"Distance % cannot be negated in a 32 bit signed integer.",distance);
			return {};
		}
		return negated;
	}

	bool Turtle::forward(std::int32_t distance,Error* error) {
		if(distance < 0) {
			auto [negated,success] = minilogo::negate_distance(distance,error);
			if(!success) return false;
			return back(negated,error);
		}
		return move(heading,distance,error);
	}

	bool Turtle::back(std::int32_t distance,Error* error) {
		if(distance < 0) {
			auto [negated,success] = minilogo::negate_distance(distance,error);
			if(!success) return false;
			return forward(negated,error);
		}
		return move(static_cast<std::int64_t>(heading) + 180,distance,error);
	}

	bool Turtle::left(std::int32_t distance,Error* error) {
		if(distance < 0) {
			auto [negated,success] = minilogo::negate_distance(distance,error);
			if(!success) return false;
			return right(negated,error);
		}
		return move(static_cast<std::int64_t>(heading) - 90,distance,error);
	}

	bool Turtle::right(std::int32_t distance,Error* error) {
		//'left' flips the sign back, so a negative distance still moves to the right.
		if(distance < 0) return left(distance,error);
		return move(static_cast<std::int64_t>(heading) + 90,distance,error);
	}

	bool Turtle::move(std::int64_t direction,std::int32_t distance,Error* error) {
		double angle = minilogo::radians(static_cast<double>(direction - 90));
		double end_x = std::round(x + distance * std::cos(angle));
		double end_y = std::round(y + distance * std::sin(angle));
		if(end_x < INT32_MIN || end_x > INT32_MAX || end_y < INT32_MIN || end_y > INT32_MAX) {
			minilogo::report_error(error,Error_Type::Overflow,"Moving % steps from (%, %) leaves the 32 bit coordinate range.",distance,x,y);
			return false;
		}

		auto new_x = static_cast<std::int32_t>(end_x);
		auto new_y = static_cast<std::int32_t>(end_y);
		if(is_pen_down) {
			if(!canvas.draw_line(x,y,new_x,new_y,minilogo::get_pen_color(pen_color_index),error)) return false;
		}
		x = new_x;
		y = new_y;
		return true;
	}

	bool Turtle::set_pen_color(std::int32_t index,Error* error) {
		if(index < 0 || index >= Pen_Color_Count) {
			Array_String<16> code{};
			minilogo::format(&code,"%",index);
			minilogo::report_invalid_argument(error,"SETPENCOLOR",code.view(),"an integer between 0 and 15");
			return false;
		}
		pen_color_index = index;
		return true;
	}

	bool Turtle::turn(std::int32_t degrees,Error* error) {
		auto [new_heading,success] = minilogo::narrow_to_int32(static_cast<std::int64_t>(heading) + degrees);
		if(!success) {
			minilogo::report_error(error,Error_Type::Overflow,"Turning % degrees from heading % overflows a 32 bit signed integer.",degrees,heading);
			return false;
		}
		heading = new_heading;
		return true;
	}

	void Turtle::set_heading(std::int32_t degrees) {
		heading = degrees;
	}

	void Turtle::set_x(std::int32_t position) {
		x = position;
	}

	void Turtle::set_y(std::int32_t position) {
		y = position;
	}

	bool Turtle::save_image(String_View file_path,Error* error) const {
		return canvas.save_image(file_path,error);
	}
}
