#pragma once

namespace mcuuid {

int offline(int argc, char* argv[]);
int online(int argc, char* argv[]);
int inspect(int argc, char* argv[]);

}  // namespace mcuuid
