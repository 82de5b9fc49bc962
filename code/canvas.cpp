#include <cstdio>
#include <cstdlib>
#include <png.h>
#include "debug.hpp"
#include "canvas.hpp"

namespace minilogo {
	static constexpr Color Background_Color = {0,0,0};

	bool Canvas::init(std::int32_t w,std::int32_t h,Error* error) {
		width = w;
		height = h;
		std::size_t pixel_count = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
		if(!pixels.resize(pixel_count,Background_Color)) {
			minilogo::report_out_of_memory(error,pixel_count * sizeof(Color));
			return false;
		}
		return true;
	}

	void Canvas::destroy() {
		pixels.destroy();
		lines.destroy();
	}

	//https://en.wikipedia.org/wiki/Bresenham%27s_line_algorithm
	bool Canvas::draw_line(std::int32_t start_x,std::int32_t start_y,std::int32_t end_x,std::int32_t end_y,Color color,Error* error) {
		Canvas_Line line{};
		line.x0 = start_x;
		line.y0 = start_y;
		line.x1 = end_x;
		line.y1 = end_y;
		line.color = color;
		if(!lines.push_back(line)) {
			minilogo::report_error(error,Error_Type::Draw_Error,"Couldn't record the line from (%, %) to (%, %).",start_x,start_y,end_x,end_y);
			return false;
		}

		auto plot = [&](std::int64_t x,std::int64_t y) {
			if(x >= 0 && x < width && y >= 0 && y < height) pixels[static_cast<std::size_t>(y * width + x)] = color;
		};
		auto plot_line_low = [&](std::int64_t x0,std::int64_t y0,std::int64_t x1,std::int64_t y1) {
			auto dx = x1 - x0;
			auto dy = y1 - y0;
			std::int64_t yi = 1;
			if(dy < 0) {
				yi = -1;
				dy = -dy;
			}
			auto d = 2 * dy - dx;
			auto y = y0;

			for(std::int64_t x = x0;x <= x1 && x < width;x += 1) {
				plot(x,y);
				if(d > 0) {
					y += yi;
					d += 2 * (dy - dx);
				}
				else d += 2 * dy;
			}
		};
		auto plot_line_high = [&](std::int64_t x0,std::int64_t y0,std::int64_t x1,std::int64_t y1) {
			auto dx = x1 - x0;
			auto dy = y1 - y0;
			std::int64_t xi = 1;
			if(dx < 0) {
				xi = -1;
				dx = -dx;
			}
			auto d = 2 * dx - dy;
			auto x = x0;

			for(std::int64_t y = y0;y <= y1 && y < height;y += 1) {
				plot(x,y);
				if(d > 0) {
					x += xi;
					d += 2 * (dx - dy);
				}
				else d += 2 * dx;
			}
		};

		std::int64_t dx = static_cast<std::int64_t>(end_x) - start_x;
		std::int64_t dy = static_cast<std::int64_t>(end_y) - start_y;
		if(std::llabs(dy) < std::llabs(dx)) {
			if(start_x > end_x) plot_line_low(end_x,end_y,start_x,start_y);
			else plot_line_low(start_x,start_y,end_x,end_y);
		}
		else {
			if(start_y > end_y) plot_line_high(end_x,end_y,start_x,start_y);
			else plot_line_high(start_x,start_y,end_x,end_y);
		}
		return true;
	}

	[[nodiscard]] static Array_String<32> make_svg_color(Color color) {
		Array_String<32> text{};
		minilogo::format(&text,"rgb(%,%,%)",static_cast<std::int32_t>(color.r),static_cast<std::int32_t>(color.g),static_cast<std::int32_t>(color.b));
		return text;
	}

	//fopen and libpng need a null terminated path.
	[[nodiscard]] static bool copy_file_path(Array_String<1024>* path,String_View file_path,Error* error) {
		if(!path->append(file_path)) {
			minilogo::report_error(error,Error_Type::Image_Save_Error,"File path \"%\" is too long.",file_path);
			return false;
		}
		return true;
	}

	bool Canvas::save_as_svg(String_View file_path,Error* error) const {
		Array_String<1024> path{};
		if(!minilogo::copy_file_path(&path,file_path,error)) return false;
		std::FILE* file = std::fopen(path.buffer,"wb");
		if(!file) {
			minilogo::report_error(error,Error_Type::Image_Save_Error,"Couldn't open file \"%\" for writing.",file_path);
			return false;
		}
		defer[&]{std::fclose(file);};

		bool write_failed = false;
		auto file_write = [&](char32_t c) {
			auto code_units = minilogo::make_code_units(c);
			if(std::fwrite(code_units.begin(),sizeof(char),code_units.length,file) < code_units.length) write_failed = true;
			return !write_failed;
		};

		minilogo::format_into(file_write,"<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"%\" height=\"%\" viewBox=\"0 0 % %\">\n",width,height,width,height);
		minilogo::format_into(file_write,"<rect width=\"%\" height=\"%\" fill=\"%\"/>\n","100%","100%",minilogo::make_svg_color(Background_Color));
		for(const auto& line : lines) {
			minilogo::format_into(file_write,"<line x1=\"%\" y1=\"%\" x2=\"%\" y2=\"%\" stroke=\"%\" stroke-width=\"1\"/>\n",
				line.x0,line.y0,line.x1,line.y1,minilogo::make_svg_color(line.color));
			if(write_failed) break;
		}
		minilogo::format_into(file_write,"</svg>\n");

		if(write_failed) {
			minilogo::report_error(error,Error_Type::Image_Save_Error,"Couldn't write to file \"%\".",file_path);
			return false;
		}
		return true;
	}

	bool Canvas::save_as_png(String_View file_path,Error* error) const {
		static_assert(sizeof(Color) == 3);
		Array_String<1024> path{};
		if(!minilogo::copy_file_path(&path,file_path,error)) return false;

		png_image image{};
		image.version = PNG_IMAGE_VERSION;
		image.width = static_cast<png_uint_32>(width);
		image.height = static_cast<png_uint_32>(height);
		image.format = PNG_FORMAT_RGB;

		auto row_stride = static_cast<png_int_32>(PNG_IMAGE_ROW_STRIDE(image));
		if(!png_image_write_to_file(&image,path.buffer,0,pixels.data,row_stride,nullptr)) {
			minilogo::report_error(error,Error_Type::Image_Save_Error,"Couldn't write PNG file \"%\": %",file_path,static_cast<const char*>(image.message));
			png_image_free(&image);
			return false;
		}
		png_image_free(&image);
		return true;
	}

	bool Canvas::save_image(String_View file_path,Error* error) const {
		String_View extension{};
		for(auto ptr = file_path.end_ptr;ptr > file_path.begin_ptr;ptr -= 1) {
			if(*(ptr - 1) == '.') {
				extension = String_View(ptr,static_cast<std::size_t>(file_path.end_ptr - ptr));
				break;
			}
		}
		minilogo::trace("Saving % line(s) to \"%\".",lines.length,file_path);

		if(minilogo::strings_equal_ignore_case(extension,"svg")) return save_as_svg(file_path,error);
		if(minilogo::strings_equal_ignore_case(extension,"png")) return save_as_png(file_path,error);
		minilogo::report_error(error,Error_Type::Image_Save_Error,"File extension not supported");
		return false;
	}
}
