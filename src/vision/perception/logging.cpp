#include "vision/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace marksman::vision {

void initLogging(const bool verbose) {
	namespace logging = boost::log;

	const auto level = verbose ? logging::trivial::debug : logging::trivial::info;
	logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace marksman::vision
