#pragma once

int runApp(int argc, char* argv[]);
