#ifndef TEST_CONTROLLER_H
#define TEST_CONTROLLER_H

void test_controller();

#endif // TEST_CONTROLLER_H
