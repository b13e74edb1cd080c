#pragma once
#include <string>
#include <vector>

// Elenca le porte seriali candidate (teste ottiche USB in primis), ordinate.
std::vector<std::string> ListSerialPorts();
