#pragma once

// Prints the Markdown for one ADF document (debugging descriptions).
int cmd_render(int argc, char** argv);

// Prints the board for a saved search response.
int cmd_board(int argc, char** argv);
