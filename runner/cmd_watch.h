#pragma once

int cmd_watch(int argc, char** argv);
int cmd_audit(int argc, char** argv);
