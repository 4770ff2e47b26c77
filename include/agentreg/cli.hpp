#pragma once

namespace agentreg::cli
{
	int run(int argc, char *argv[]);
}
