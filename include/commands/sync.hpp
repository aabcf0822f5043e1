#pragma once

int cmd_sync(int argc, char** argv);
