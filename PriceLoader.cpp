#include <cmath>
#include <fstream>
#include <filesystem>
#include <stdexcept>

#include <boost/algorithm/string.hpp>
namespace ba = boost::algorithm;

#include "PriceLoader.hpp"

using namespace chartgeom;

std::vector<std::string> parse_line(const std::string &line, const std::string &del){
	std::vector<std::string> tokens;
	ba::split(tokens, line, ba::is_any_of(del));
	for(auto &t: tokens){
		ba::trim(t);
	}
	return tokens;
}

Sample parse_price(const std::string &token){
	if(token.empty())
		return std::nullopt;
	size_t pos = 0;
	double price = std::stod(token, &pos);
	if(pos != token.size())
		throw std::invalid_argument("trailing characters in price " + token);
	if(!std::isfinite(price))
		throw std::invalid_argument("non-finite price " + token);
	return price;
}

uint64_t parse_volume(const std::string &token){
	if(token.empty())
		return 0;
	if(token[0] == '-')
		throw std::invalid_argument("negative volume " + token);
	size_t pos = 0;
	uint64_t volume = std::stoull(token, &pos);
	if(pos != token.size())
		throw std::invalid_argument("trailing characters in volume " + token);
	return volume;
}

Result parse_bar(const std::string &line, Bar &bar){
	auto tokens = parse_line(line, ";");
	if(tokens.size() != BAR_FIELDS)
		return Result::Failure;

	auto datetokens = parse_line(tokens[2], "/");
	if(datetokens.size() != 3)
		return Result::Failure;

	try{
		auto psxdate = "20" + datetokens[2] + "-" + datetokens[0] + "-" + datetokens[1];
		bar.time = bt::time_from_string(psxdate + " " + tokens[3]);
		bar.open = parse_price(tokens[4]);
		bar.high = parse_price(tokens[5]);
		bar.low = parse_price(tokens[6]);
		bar.close = parse_price(tokens[7]);
		bar.volume = parse_volume(tokens[8]);
	}catch(const std::exception &e){
		LOG_WARNING("bad bar '%s': %s", line.c_str(), e.what());
		return Result::Failure;
	}
	return Result::Success;
}

PriceFrame read_frame(std::istream &in, const std::string &ticker){
	PriceFrame frame{ticker};
	size_t skipped = 0;

	std::string line;
	getline(in, line); //first line with headers
	for(; getline(in, line);){
		if(ba::trim_copy(line).empty())
			continue;
		Bar bar;
		if(parse_bar(line, bar) != Result::Success){
			skipped++;
			continue;
		}
		frame.push(bar);
	}
	if(skipped)
		LOG_WARNING("%s: skipped %zu malformed lines", ticker.c_str(), skipped);

	auto broken = frame.validate();
	if(!broken.empty())
		LOG_WARNING("%s: %zu bars with high below low, first at %zu",
			ticker.c_str(), broken.size(), broken.front());
	return frame;
}

PriceFrame load_frame(const std::string &file){
	std::ifstream infile(file);
	if(!infile)
		throw std::invalid_argument("cannot open " + file);

	std::string ticker = std::filesystem::path(file).stem().string();
	return read_frame(infile, ticker);
}

std::vector<PriceFrame> load_frames(const std::vector<std::string> &files){
	std::vector<PriceFrame> frames;
	for(const auto &file: files){
		frames.push_back(load_frame(file));
	}
	return frames;
}
