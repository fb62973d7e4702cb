#ifndef SWPLAT_MAIN_HPP
#define SWPLAT_MAIN_HPP

#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>

#include "Args.hpp"
#include "Client.hpp"
#include "Service.hpp"

using sp::Args;
using sp::Client;
using sp::Util::is_root;

int main(int argc, char *argv[]);

namespace sp {
Args &read_args(int argc, char **argv, Args &args);
void print_args(Args &args);
path config_path(const Args &args);
void signal_handler(int signal);
void register_signal_handler();
} // namespace sp

#endif // SWPLAT_MAIN_HPP
