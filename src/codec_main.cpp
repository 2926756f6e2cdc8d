#include "shed/codec_tool.hpp"

int main(int argc, char *argv[]) { return shed::run_codec_tool(argc, argv); }
